/**
 * @file parser.hh
 * @brief Build chunk trees from RIFF encoded bytes
 */

#pragma once

#include <cstddef>
#include <iosfwd>
#include <span>
#include <riff/export_riff.h>
#include <riff/chunk.hh>
#include <riff/parse_options.hh>

namespace riff {

    /**
     * @brief Parse the chunk stored at the start of a buffer
     *
     * Reads exactly one chunk starting at offset 0, descending into
     * "RIFF" and "LIST" containers. Leaf payloads are copied, so the
     * returned tree does not reference the buffer.
     *
     * @param buffer Encoded bytes, never modified
     * @param options Parse options
     * @return Root chunk
     * @throws truncated_error if the buffer ends early or the children of a
     *         container do not end exactly at its declared length
     * @throws invalid_length_error if a length field overflows 32-bit
     *         arithmetic or a container is too short to hold its type
     * @throws parse_error for trailing data or nesting depth, when the
     *         options forbid them
     */
    RIFF_EXPORT chunk parse(std::span<const std::byte> buffer, const parse_options& options = {});

    /**
     * @brief Read a stream to its end and parse its contents
     * @param stream Input stream positioned at the root chunk
     * @param options Parse options
     * @throws io_error if reading the stream fails
     */
    RIFF_EXPORT chunk parse(std::istream& stream, const parse_options& options = {});

} // namespace riff
