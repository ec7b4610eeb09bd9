/**
 * @file fourcc.hh
 * @brief Four character chunk identifiers
 */
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>
#include <ostream>
#include <iomanip>

namespace riff {
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces)
        constexpr fourcc() = default;

        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        constexpr fourcc(std::byte c0, std::byte c1, std::byte c2, std::byte c3)
            : b{ static_cast<char>(c0), static_cast<char>(c1), static_cast<char>(c2), static_cast<char>(c3) } {}

        // Pads short strings with spaces, truncates long ones.
        // Use chunk constructors taking std::string_view for checked ids.
        explicit fourcc(std::string_view sv) : b{' ', ' ', ' ', ' '} {
            std::copy_n(sv.begin(), std::min(sv.size(), std::size_t(4)), b.begin());
        }

        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        constexpr bool operator==(const fourcc& o) const { return b == o.b; }
        constexpr bool operator!=(const fourcc& o) const { return !(*this == o); }

        [[nodiscard]] bool is_printable() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return c >= 32 && c <= 126;
            });
        }

        // Quoted, with non-printable bytes escaped as \xNN
        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            auto flags = os.flags();
            auto fill = os.fill();
            os << '\'';
            for (char c : f.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            os << '\'';
            return os;
        }
    };

    // Chunk ids are exactly four bytes; anything else is rejected
    constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("FourCC literal must be exactly 4 characters");
        }
        return {str[0], str[1], str[2], str[3]};
    }

}

