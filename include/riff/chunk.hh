/**
 * @file chunk.hh
 * @brief In-memory chunk tree for RIFF files
 *
 * A chunk is either a leaf holding an opaque payload or a container
 * holding a form type and an ordered list of children. The kind is fixed
 * when the chunk is built: ids "RIFF" and "LIST" make a container, every
 * other id makes a leaf. Trees are immutable once constructed.
 *
 * Encoded layout (little-endian):
 * @code
 *   0..4   id
 *   4..8   declared length (payload bytes, padding excluded)
 *   8..    payload [+ one padding byte when the declared length is odd]
 * @endcode
 * A container payload starts with its 4-byte type followed by the encoded
 * children.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <riff/export_riff.h>
#include <riff/fourcc.hh>

namespace riff {

    namespace chunk_id {
        inline constexpr fourcc RIFF('R', 'I', 'F', 'F');
        inline constexpr fourcc LIST('L', 'I', 'S', 'T');
    }

    /// Size of the id + length header in bytes
    inline constexpr std::uint32_t chunk_header_size = 8;

    /// Largest declared length whose padded chunk still fits a 32-bit size
    inline constexpr std::uint32_t max_declared_length = 0xFFFFFFF6u;

    /// Padding byte used by the writers unless the caller picks another
    inline constexpr std::byte default_pad_byte{0x00};

    /**
     * @brief Check whether an id marks a container chunk
     * @return True for "RIFF" and "LIST"
     */
    constexpr bool is_container_id(const fourcc& id) {
        return id == chunk_id::RIFF || id == chunk_id::LIST;
    }

    class chunk;

    /**
     * @class leaf_chunk
     * @brief Chunk with an opaque payload
     */
    class RIFF_EXPORT leaf_chunk {
    public:
        /**
         * @brief Build a leaf chunk
         * @param id Chunk id, must not be a container keyword
         * @param data Payload, owned by the chunk
         * @throws invalid_chunk_error if id is "RIFF" or "LIST"
         * @throws invalid_length_error if data exceeds max_declared_length
         */
        leaf_chunk(fourcc id, std::vector<std::byte> data);

        /**
         * @brief Build a leaf chunk from a textual id
         * @throws invalid_chunk_error if id is not exactly 4 bytes long
         */
        leaf_chunk(std::string_view id, std::vector<std::byte> data);

        [[nodiscard]] const fourcc& id() const { return m_id; }
        [[nodiscard]] std::span<const std::byte> data() const { return m_data; }

        /// Value of the header length field: the payload size without padding
        [[nodiscard]] std::uint32_t declared_length() const {
            return static_cast<std::uint32_t>(m_data.size());
        }

        /// Encoded size including header and padding; always even
        [[nodiscard]] std::uint32_t size() const;

        /**
         * @brief Serialize into a caller provided buffer
         * @param out Destination, at least size() bytes
         * @param pad Value of the padding byte written after odd payloads
         * @return Number of bytes written, equal to size()
         * @throws buffer_too_small_error before writing anything if out is too small
         */
        std::size_t write_into(std::span<std::byte> out, std::byte pad = default_pad_byte) const;

        /**
         * @brief Serialize to an output stream
         * @throws io_error if the stream fails
         */
        void write_stream(std::ostream& os, std::byte pad = default_pad_byte) const;

        bool operator==(const leaf_chunk& other) const;
        bool operator!=(const leaf_chunk& other) const { return !(*this == other); }

    private:
        fourcc m_id;
        std::vector<std::byte> m_data;
    };

    /**
     * @class container_chunk
     * @brief "RIFF" or "LIST" chunk with a form type and nested chunks
     *
     * The declared length is computed once from the children when the
     * container is built.
     */
    class RIFF_EXPORT container_chunk {
    public:
        using const_iterator = std::vector<chunk>::const_iterator;

        /**
         * @brief Build a container chunk
         * @param id Container keyword ("RIFF" or "LIST")
         * @param type Form type, e.g. "WAVE" or "INFO"
         * @param subchunks Children in encoding order
         * @throws invalid_chunk_error if id is not a container keyword
         * @throws invalid_length_error if the children do not fit a 32-bit length
         */
        container_chunk(fourcc id, fourcc type, std::vector<chunk> subchunks);

        /**
         * @brief Build a container chunk from textual ids
         * @throws invalid_chunk_error if id or type is not exactly 4 bytes long
         */
        container_chunk(std::string_view id, std::string_view type, std::vector<chunk> subchunks);

        [[nodiscard]] const fourcc& id() const { return m_id; }
        [[nodiscard]] const fourcc& type() const { return m_type; }
        [[nodiscard]] const std::vector<chunk>& subchunks() const;
        [[nodiscard]] std::size_t count() const;
        [[nodiscard]] bool empty() const;

        const_iterator begin() const;
        const_iterator end() const;

        /**
         * @brief Child at a position
         * @throws index_out_of_range_error if index >= count()
         */
        [[nodiscard]] const chunk& get_by_index(std::size_t index) const;

        /**
         * @brief First child whose id, or container type, equals name
         *
         * Lets a caller address a nested container either by its keyword
         * or by its form type, e.g. get_by_name("INFO"_4cc) finds
         * LIST/INFO.
         *
         * @throws key_not_found_error if no child matches
         */
        [[nodiscard]] const chunk& get_by_name(const fourcc& name) const;

        /**
         * @brief Same lookup as get_by_name
         * @return Matching child or nullptr
         */
        [[nodiscard]] const chunk* find(const fourcc& name) const;

        [[nodiscard]] std::uint32_t declared_length() const { return m_declared_length; }
        [[nodiscard]] std::uint32_t size() const;

        std::size_t write_into(std::span<std::byte> out, std::byte pad = default_pad_byte) const;
        void write_stream(std::ostream& os, std::byte pad = default_pad_byte) const;

        bool operator==(const container_chunk& other) const;
        bool operator!=(const container_chunk& other) const { return !(*this == other); }

    private:
        fourcc m_id;
        fourcc m_type;
        std::vector<chunk> m_subchunks;
        std::uint32_t m_declared_length;
    };

    /**
     * @class chunk
     * @brief Either a leaf_chunk or a container_chunk
     */
    class RIFF_EXPORT chunk {
    public:
        chunk(leaf_chunk leaf);
        chunk(container_chunk container);

        [[nodiscard]] bool is_container() const;
        [[nodiscard]] const fourcc& id() const;
        [[nodiscard]] std::uint32_t declared_length() const;
        [[nodiscard]] std::uint32_t size() const;

        /// Variant access, nullptr for the other kind
        [[nodiscard]] const leaf_chunk* leaf() const;
        [[nodiscard]] const container_chunk* container() const;

        /// Variant access, throws invalid_chunk_error for the other kind
        [[nodiscard]] const leaf_chunk& as_leaf() const;
        [[nodiscard]] const container_chunk& as_container() const;

        std::size_t write_into(std::span<std::byte> out, std::byte pad = default_pad_byte) const;
        void write_stream(std::ostream& os, std::byte pad = default_pad_byte) const;

        /// Serialize into a newly allocated buffer of size() bytes
        [[nodiscard]] std::vector<std::byte> to_bytes(std::byte pad = default_pad_byte) const;

        template<typename Visitor>
        decltype(auto) visit(Visitor&& visitor) const {
            return std::visit(std::forward<Visitor>(visitor), m_value);
        }

        bool operator==(const chunk& other) const;
        bool operator!=(const chunk& other) const { return !(*this == other); }

    private:
        std::variant<leaf_chunk, container_chunk> m_value;
    };

} // namespace riff
