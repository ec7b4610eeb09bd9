/**
 * @file riff_copy.cpp
 * @brief Parse a RIFF file and write it back out
 *
 * The output is byte-identical to the input except for padding bytes,
 * which are replaced by the pad value given on the command line and
 * trailing data, which is dropped.
 *
 * Usage: riff_copy <input> <output> [pad]
 */

#include <riff/parser.hh>
#include <riff/exceptions.hh>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        std::cout << "Usage: " << argv[0] << " <input> <output> [pad]\n";
        std::cout << "\n";
        std::cout << "  pad  Value of the padding byte after odd sized payloads (0-255, default 0)\n";
        return 1;
    }

    std::byte pad = riff::default_pad_byte;
    if (argc == 4) {
        const std::string text = argv[3];
        int value = -1;
        std::size_t consumed = 0;
        try {
            value = std::stoi(text, &consumed, 0);
        } catch (const std::logic_error&) {
            // handled by the range check below
        }
        if (consumed != text.size() || value < 0 || value > 255) {
            std::cerr << "Error: Invalid pad byte '" << argv[3] << "'\n";
            return 1;
        }
        pad = static_cast<std::byte>(value);
    }

    std::ifstream in(argv[1], std::ios::binary);
    if (!in) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    riff::parse_options options;
    options.max_depth = 100;  // Bounds recursion on hostile input

    try {
        riff::chunk root = riff::parse(in, options);

        std::ofstream out(argv[2], std::ios::binary);
        if (!out) {
            std::cerr << "Error: Cannot create file '" << argv[2] << "'\n";
            return 1;
        }
        root.write_stream(out, pad);
        out.close();
        if (!out) {
            std::cerr << "Error: Failed to write file '" << argv[2] << "'\n";
            return 1;
        }

        std::cout << "Wrote " << root.size() << " bytes to " << argv[2] << "\n";
    } catch (const riff::riff_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
