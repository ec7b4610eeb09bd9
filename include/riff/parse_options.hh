/**
 * @file parse_options.hh
 * @brief Parsing options for RIFF buffers
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace riff {

    /**
     * @struct parse_options
     * @brief Configuration options for riff::parse
     *
     * The defaults accept any well-formed chunk tree: nesting depth is not
     * limited and bytes after the root chunk are ignored.
     */
    struct parse_options {
        /**
         * @brief Maximum nesting depth for containers
         *
         * The root chunk is at depth 0. A container at a depth greater or
         * equal to this value is a parse_error. Zero disables the limit.
         *
         * The parser recurses once per nesting level, so with no limit a
         * crafted file of nested "LIST" chunks can exhaust the stack. Set a
         * limit when parsing untrusted input.
         */
        int max_depth = 0;

        /**
         * @brief Accept bytes after the end of the root chunk
         *
         * When false, trailing bytes raise a parse_error. When true, they
         * are ignored and reported through on_warning.
         */
        bool allow_trailing_data = true;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Buffer offset where warning occurred
         * @param category Warning category (e.g. "trailing_data")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace riff
