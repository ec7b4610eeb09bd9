/**
 * @file riff_dump.cpp
 * @brief Print the chunk tree of a RIFF file
 *
 * Usage: riff_dump <file>
 */

#include <riff/parser.hh>
#include <riff/dump.hh>
#include <riff/exceptions.hh>
#include <iostream>
#include <fstream>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file>\n";
        std::cout << "\n";
        std::cout << "Prints every chunk of a RIFF file with a preview of its payload.\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    riff::parse_options options;
    options.max_depth = 100;  // Bounds recursion on hostile input
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    try {
        riff::chunk root = riff::parse(file, options);
        riff::dump(std::cout, root);
    } catch (const riff::riff_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
