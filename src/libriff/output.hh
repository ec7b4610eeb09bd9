//
// Byte sinks used by the chunk writers
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <span>

#include <riff/exceptions.hh>
#include <riff/fourcc.hh>

namespace riff {
    class leaf_chunk;
    class container_chunk;
    class chunk;

    // Base writer interface
    class writer_base {
        public:
            virtual ~writer_base() = default;

            // Simple interface - throws on error
            virtual void write(const void* src, std::size_t size) = 0;

            // Convenience methods
            void write_fourcc(const fourcc& id);
            void write_le32(std::uint32_t value);
            void write_byte(std::byte value);
    };

    // Writes into a caller supplied memory region. The region is checked
    // against the chunk size up front; overruns here mean a size() bug.
    class buffer_writer : public writer_base {
        public:
            explicit buffer_writer(std::span<std::byte> buffer);

            void write(const void* src, std::size_t size) override;

        private:
            std::span<std::byte> m_buffer;
            std::size_t m_position;
    };

    // Appends to an output stream
    class stream_writer : public writer_base {
        public:
            explicit stream_writer(std::ostream& os);

            void write(const void* src, std::size_t size) override;

        private:
            std::ostream& m_stream;
            std::uint64_t m_written;
    };

    // Recursive serialization shared by write_into and write_stream
    void write_chunk(writer_base& out, const leaf_chunk& leaf, std::byte pad);
    void write_chunk(writer_base& out, const container_chunk& container, std::byte pad);
    void write_chunk(writer_base& out, const chunk& c, std::byte pad);
}
