/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for libriff
 *
 * Every error raised by the library derives from riff_error, so a single
 * catch block handles all of them. Malformed input, invalid construction,
 * lookup failures and capacity violations each get their own branch of the
 * hierarchy.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace riff {

    /**
     * @class riff_error
     * @brief Base exception class for all libriff errors
     */
    class riff_error : public std::runtime_error {
    public:
        explicit riff_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Stream reading or writing failed
     */
    class io_error : public riff_error {
    public:
        explicit io_error(const std::string& msg)
            : riff_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Base class for malformed input
     *
     * Thrown directly for policy violations (trailing data in strict mode,
     * nesting deeper than parse_options::max_depth).
     */
    class parse_error : public riff_error {
    public:
        explicit parse_error(const std::string& msg)
            : riff_error(msg) {}
    };

    /**
     * @class truncated_error
     * @brief The buffer ends before a chunk does, or the children of a
     * container do not add up to its declared length
     */
    class truncated_error : public parse_error {
    public:
        explicit truncated_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class invalid_length_error
     * @brief A length field that cannot be represented in 32 bits, or is
     * too small for the chunk kind
     */
    class invalid_length_error : public parse_error {
    public:
        explicit invalid_length_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class invalid_chunk_error
     * @brief A chunk was constructed with an id that does not fit its kind
     */
    class invalid_chunk_error : public riff_error {
    public:
        explicit invalid_chunk_error(const std::string& msg)
            : riff_error(msg) {}
    };

    /**
     * @class lookup_error
     * @brief Base class for failed child lookups
     *
     * These are expected failures, not signs of corruption.
     */
    class lookup_error : public riff_error {
    public:
        explicit lookup_error(const std::string& msg)
            : riff_error(msg) {}
    };

    class key_not_found_error : public lookup_error {
    public:
        explicit key_not_found_error(const std::string& msg)
            : lookup_error(msg) {}
    };

    class index_out_of_range_error : public lookup_error {
    public:
        explicit index_out_of_range_error(const std::string& msg)
            : lookup_error(msg) {}
    };

    /**
     * @class buffer_too_small_error
     * @brief Destination buffer cannot hold the serialized chunk
     *
     * Raised before any byte is written.
     */
    class buffer_too_small_error : public riff_error {
    public:
        explicit buffer_too_small_error(const std::string& msg)
            : riff_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_AS
     * @brief Throw an exception of the given libriff type with formatted message
     */
    #define THROW_AS(type, ...) \
        throw ::riff::type(::riff::build_error_msg(__VA_ARGS__))

    #define THROW_AS_IF(condition, type, ...) \
        do { if (condition) THROW_AS(type, __VA_ARGS__); } while(0)

    #define THROW_IO(...) THROW_AS(io_error, __VA_ARGS__)

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE(...) THROW_AS(parse_error, __VA_ARGS__)

    #define THROW_TRUNCATED_IF(condition, ...) \
        do { if (condition) THROW_AS(truncated_error, __VA_ARGS__); } while(0)

    #define THROW_INVALID_CHUNK_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_AS(invalid_chunk_error, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace riff
