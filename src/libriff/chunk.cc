//
// Chunk tree construction, lookup and size accounting
//

#include <riff/chunk.hh>
#include <riff/exceptions.hh>
#include <algorithm>
#include <ostream>

#include "output.hh"

namespace riff {

    namespace {
        fourcc checked_id(std::string_view id, const char* what) {
            THROW_INVALID_CHUNK_UNLESS(id.size() == 4,
                                       what, " '", id, "' must be exactly 4 bytes, got ", id.size());
            return fourcc(id);
        }

        // Header + payload + one padding byte for odd payloads
        std::uint32_t padded_size(std::uint32_t declared_length) {
            return chunk_header_size + declared_length + (declared_length & 1u);
        }

        bool matches(const chunk& c, const fourcc& name) {
            if (c.id() == name) {
                return true;
            }
            const auto* container = c.container();
            return container && container->type() == name;
        }

        template<typename Chunk>
        std::size_t write_checked(const Chunk& c, std::span<std::byte> out, std::byte pad) {
            const std::uint32_t required = c.size();
            THROW_AS_IF(out.size() < required, buffer_too_small_error,
                        "Chunk ", c.id(), " needs ", required, " bytes, but the buffer holds only ",
                        out.size(), " bytes");
            buffer_writer writer(out);
            write_chunk(writer, c, pad);
            return required;
        }

        template<typename Chunk>
        void write_to_stream(const Chunk& c, std::ostream& os, std::byte pad) {
            stream_writer writer(os);
            write_chunk(writer, c, pad);
        }
    }

    // leaf_chunk

    leaf_chunk::leaf_chunk(fourcc id, std::vector<std::byte> data)
        : m_id(id)
        , m_data(std::move(data)) {
        THROW_INVALID_CHUNK_UNLESS(!is_container_id(m_id),
                                   "Leaf chunk cannot use container id ", m_id);
        THROW_AS_IF(m_data.size() > max_declared_length, invalid_length_error,
                    "Leaf chunk ", m_id, " payload of ", m_data.size(),
                    " bytes exceeds the maximum of ", max_declared_length, " bytes");
    }

    leaf_chunk::leaf_chunk(std::string_view id, std::vector<std::byte> data)
        : leaf_chunk(checked_id(id, "Chunk id"), std::move(data)) {
    }

    std::uint32_t leaf_chunk::size() const {
        return padded_size(declared_length());
    }

    std::size_t leaf_chunk::write_into(std::span<std::byte> out, std::byte pad) const {
        return write_checked(*this, out, pad);
    }

    void leaf_chunk::write_stream(std::ostream& os, std::byte pad) const {
        write_to_stream(*this, os, pad);
    }

    bool leaf_chunk::operator==(const leaf_chunk& other) const {
        return m_id == other.m_id && m_data == other.m_data;
    }

    // container_chunk

    container_chunk::container_chunk(fourcc id, fourcc type, std::vector<chunk> subchunks)
        : m_id(id)
        , m_type(type)
        , m_subchunks(std::move(subchunks))
        , m_declared_length(0) {
        THROW_INVALID_CHUNK_UNLESS(is_container_id(m_id),
                                   "Container chunk needs a container id ('RIFF' or 'LIST'), got ", m_id);

        // The form type counts towards the declared length
        std::uint64_t length = 4;
        for (const auto& child : m_subchunks) {
            length += child.size();
            THROW_AS_IF(length > max_declared_length, invalid_length_error,
                        "Container ", m_id, "/", m_type, " with ", m_subchunks.size(),
                        " subchunks exceeds the maximum length of ", max_declared_length, " bytes");
        }
        m_declared_length = static_cast<std::uint32_t>(length);
    }

    container_chunk::container_chunk(std::string_view id, std::string_view type, std::vector<chunk> subchunks)
        : container_chunk(checked_id(id, "Container id"), checked_id(type, "Container type"),
                          std::move(subchunks)) {
    }

    const std::vector<chunk>& container_chunk::subchunks() const {
        return m_subchunks;
    }

    std::size_t container_chunk::count() const {
        return m_subchunks.size();
    }

    bool container_chunk::empty() const {
        return m_subchunks.empty();
    }

    container_chunk::const_iterator container_chunk::begin() const {
        return m_subchunks.begin();
    }

    container_chunk::const_iterator container_chunk::end() const {
        return m_subchunks.end();
    }

    const chunk& container_chunk::get_by_index(std::size_t index) const {
        THROW_AS_IF(index >= m_subchunks.size(), index_out_of_range_error,
                    "Index ", index, " out of range for container ", m_id, "/", m_type,
                    " with ", m_subchunks.size(), " subchunks");
        return m_subchunks[index];
    }

    const chunk& container_chunk::get_by_name(const fourcc& name) const {
        const chunk* found = find(name);
        THROW_AS_IF(!found, key_not_found_error,
                    "No subchunk ", name, " in container ", m_id, "/", m_type);
        return *found;
    }

    const chunk* container_chunk::find(const fourcc& name) const {
        auto it = std::find_if(m_subchunks.begin(), m_subchunks.end(),
                               [&name](const chunk& c) { return matches(c, name); });
        return it == m_subchunks.end() ? nullptr : &*it;
    }

    std::uint32_t container_chunk::size() const {
        return padded_size(m_declared_length);
    }

    std::size_t container_chunk::write_into(std::span<std::byte> out, std::byte pad) const {
        return write_checked(*this, out, pad);
    }

    void container_chunk::write_stream(std::ostream& os, std::byte pad) const {
        write_to_stream(*this, os, pad);
    }

    bool container_chunk::operator==(const container_chunk& other) const {
        return m_id == other.m_id && m_type == other.m_type && m_subchunks == other.m_subchunks;
    }

    // chunk

    chunk::chunk(leaf_chunk leaf)
        : m_value(std::move(leaf)) {
    }

    chunk::chunk(container_chunk container)
        : m_value(std::move(container)) {
    }

    bool chunk::is_container() const {
        return std::holds_alternative<container_chunk>(m_value);
    }

    const fourcc& chunk::id() const {
        return visit([](const auto& c) -> const fourcc& { return c.id(); });
    }

    std::uint32_t chunk::declared_length() const {
        return visit([](const auto& c) { return c.declared_length(); });
    }

    std::uint32_t chunk::size() const {
        return visit([](const auto& c) { return c.size(); });
    }

    const leaf_chunk* chunk::leaf() const {
        return std::get_if<leaf_chunk>(&m_value);
    }

    const container_chunk* chunk::container() const {
        return std::get_if<container_chunk>(&m_value);
    }

    const leaf_chunk& chunk::as_leaf() const {
        const auto* p = leaf();
        THROW_INVALID_CHUNK_UNLESS(p, "Chunk ", id(), " is a container, not a leaf");
        return *p;
    }

    const container_chunk& chunk::as_container() const {
        const auto* p = container();
        THROW_INVALID_CHUNK_UNLESS(p, "Chunk ", id(), " is a leaf, not a container");
        return *p;
    }

    std::size_t chunk::write_into(std::span<std::byte> out, std::byte pad) const {
        return write_checked(*this, out, pad);
    }

    void chunk::write_stream(std::ostream& os, std::byte pad) const {
        write_to_stream(*this, os, pad);
    }

    std::vector<std::byte> chunk::to_bytes(std::byte pad) const {
        std::vector<std::byte> result(size());
        write_into(result, pad);
        return result;
    }

    bool chunk::operator==(const chunk& other) const {
        return m_value == other.m_value;
    }

} // namespace riff
