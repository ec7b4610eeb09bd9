/**
 * @file dump.hh
 * @brief Human readable rendering of chunk trees
 *
 * One line per chunk, children indented below their container:
 * @code
 *   'RIFF' [8 + 40 bytes (2 subchunks)]
 *       'WAVE'
 *       'fmt ' [8 + 16 bytes] 01 00 02 00 44 ac 00 00 10 b1 02 00 04 00 10 00
 *       'data' [8 + 3 + 1 bytes] 01 02 03
 * @endcode
 */

#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <riff/export_riff.h>
#include <riff/chunk.hh>

namespace riff {

    struct dump_options {
        /// Spaces added per nesting level
        std::size_t indent = 4;

        /// Leading payload bytes shown in hex after each leaf; 0 hides the payload
        std::size_t preview_bytes = 16;
    };

    RIFF_EXPORT void dump(std::ostream& os, const chunk& c, const dump_options& options = {});

    RIFF_EXPORT std::string to_string(const chunk& c, const dump_options& options = {});

    RIFF_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace riff
