//
// Byte sinks used by the chunk writers
//

#include <ostream>
#include <array>
#include <cstring>

#include <riff/chunk.hh>
#include <riff/endian.hh>
#include "output.hh"

namespace riff {
    // writer_base implementation
    void writer_base::write_fourcc(const fourcc& id) {
        std::array<char, 4> data;
        id.to_bytes(data.data());
        write(data.data(), data.size());
    }

    void writer_base::write_le32(std::uint32_t value) {
        std::array<std::byte, 4> data;
        store_le32(data.data(), value);
        write(data.data(), data.size());
    }

    void writer_base::write_byte(std::byte value) {
        write(&value, 1);
    }

    // buffer_writer implementation
    buffer_writer::buffer_writer(std::span<std::byte> buffer)
        : m_buffer(buffer), m_position(0) {}

    void buffer_writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return;
        }
        THROW_AS_IF(size > m_buffer.size() - m_position, buffer_too_small_error,
                    "Write of ", size, " bytes at offset ", m_position,
                    " overruns buffer of ", m_buffer.size(), " bytes");
        std::memcpy(m_buffer.data() + m_position, src, size);
        m_position += size;
    }

    // stream_writer implementation
    stream_writer::stream_writer(std::ostream& os)
        : m_stream(os), m_written(0) {}

    void stream_writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return;
        }
        THROW_IO_IF(!m_stream.good(), "Stream in bad state");

        m_stream.write(static_cast<const char*>(src), static_cast<std::streamsize>(size));
        THROW_IO_IF(m_stream.fail(), "Stream write of ", size, " bytes failed after ", m_written, " bytes");
        m_written += size;
    }

    // Chunk serialization
    void write_chunk(writer_base& out, const leaf_chunk& leaf, std::byte pad) {
        auto data = leaf.data();
        out.write_fourcc(leaf.id());
        out.write_le32(leaf.declared_length());
        out.write(data.data(), data.size());
        if (leaf.declared_length() & 1) {
            out.write_byte(pad);
        }
    }

    void write_chunk(writer_base& out, const container_chunk& container, std::byte pad) {
        out.write_fourcc(container.id());
        out.write_le32(container.declared_length());
        out.write_fourcc(container.type());
        for (const auto& child : container) {
            write_chunk(out, child, pad);
        }
    }

    void write_chunk(writer_base& out, const chunk& c, std::byte pad) {
        c.visit([&out, pad](const auto& variant) {
            write_chunk(out, variant, pad);
        });
    }
}
