//
// Recursive descent parser for RIFF chunk trees
//

#include <riff/parser.hh>
#include <riff/endian.hh>
#include <riff/exceptions.hh>
#include <array>
#include <istream>
#include <vector>

namespace riff {

    namespace {
        constexpr std::uint32_t container_type_size = 4;

        class chunk_parser {
        public:
            explicit chunk_parser(const parse_options& options)
                : m_options(options) {}

            // Parse the chunk whose header starts at view[0]. The view ends at
            // the enclosing container's end (or the buffer end for the root);
            // offset is the absolute position of view[0], used in messages.
            chunk parse_chunk(std::span<const std::byte> view, std::uint64_t offset, int depth) const {
                THROW_TRUNCATED_IF(view.size() < chunk_header_size,
                                   "Truncated chunk header at offset ", offset, ": need ",
                                   chunk_header_size, " bytes, only ", view.size(), " available");

                const fourcc id = fourcc::from_bytes(view.data());
                const std::uint32_t length = load_le32(view.data() + 4);

                THROW_AS_IF(length > max_declared_length, invalid_length_error,
                            "Chunk ", id, " at offset ", offset, " declares ", length,
                            " bytes, which overflows the 32-bit chunk size");

                const std::uint32_t end = chunk_header_size + length;
                THROW_TRUNCATED_IF(view.size() < end,
                                   "Chunk ", id, " at offset ", offset, " declares ", length,
                                   " bytes of payload, but only ", view.size() - chunk_header_size,
                                   " bytes are available");

                if (is_container_id(id)) {
                    return parse_container(id, view.first(end), offset, depth);
                }

                auto payload = view.subspan(chunk_header_size, length);
                return leaf_chunk(id, std::vector<std::byte>(payload.begin(), payload.end()));
            }

        private:
            // view covers exactly header + declared length of the container
            container_chunk parse_container(const fourcc& id, std::span<const std::byte> view,
                                            std::uint64_t offset, int depth) const {
                if (m_options.max_depth > 0 && depth >= m_options.max_depth) {
                    THROW_PARSE("Container ", id, " at offset ", offset,
                                " would exceed maximum nesting depth of ", m_options.max_depth,
                                " (current depth: ", depth, ")");
                }

                THROW_AS_IF(view.size() < chunk_header_size + container_type_size, invalid_length_error,
                            "Container ", id, " at offset ", offset, " declares ",
                            view.size() - chunk_header_size, " bytes, too short for its form type");

                const fourcc type = fourcc::from_bytes(view.data() + chunk_header_size);

                std::vector<chunk> subchunks;
                std::size_t cursor = chunk_header_size + container_type_size;
                while (cursor < view.size()) {
                    chunk child = parse_chunk(view.subspan(cursor), offset + cursor, depth + 1);
                    // size() includes the padding byte, so the cursor lands on the next header
                    cursor += child.size();
                    subchunks.push_back(std::move(child));
                }

                THROW_TRUNCATED_IF(cursor != view.size(),
                                   "Subchunks of container ", id, "/", type, " at offset ", offset,
                                   " end at offset ", offset + cursor, ", past its declared end at offset ",
                                   offset + view.size());

                return container_chunk(id, type, std::move(subchunks));
            }

            const parse_options& m_options;
        };

        std::vector<std::byte> read_stream(std::istream& is) {
            THROW_IO_IF(!is.good(), "Stream in bad state");

            std::vector<std::byte> buffer;
            std::array<char, 64 * 1024> block;
            while (is) {
                is.read(block.data(), static_cast<std::streamsize>(block.size()));
                auto actual = static_cast<std::size_t>(is.gcount());
                const auto* first = reinterpret_cast<const std::byte*>(block.data());
                buffer.insert(buffer.end(), first, first + actual);
            }

            THROW_IO_IF(is.bad(), "Stream read failed after ", buffer.size(), " bytes");
            return buffer;
        }
    }

    chunk parse(std::span<const std::byte> buffer, const parse_options& options) {
        chunk_parser parser(options);
        chunk root = parser.parse_chunk(buffer, 0, 0);

        // Anything past the root chunk (and its padding byte) is not part of the tree
        const std::uint64_t consumed = root.size();
        if (buffer.size() > consumed) {
            const std::uint64_t trailing = buffer.size() - consumed;
            if (!options.allow_trailing_data) {
                THROW_PARSE(trailing, " bytes of trailing data after root chunk ", root.id(),
                            " at offset ", consumed);
            }
            if (options.on_warning) {
                options.on_warning(consumed, "trailing_data",
                                   build_error_msg(trailing, " bytes after root chunk ", root.id(),
                                                   " ignored"));
            }
        }

        return root;
    }

    chunk parse(std::istream& stream, const parse_options& options) {
        const auto buffer = read_stream(stream);
        return parse(std::span<const std::byte>(buffer), options);
    }

} // namespace riff
