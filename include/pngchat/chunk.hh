/**
 * @file chunk.hh
 * @brief A single length-prefixed, checksummed PNG chunk
 *
 * On-wire layout, all integers big-endian:
 * @code
 *   [length:4][type:4][data:length][crc:4]
 * @endcode
 * The CRC covers the type code and the data, never the length field.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngchat/chunk_type.hh>
#include <pngchat/export_pngchat.h>

namespace pngchat {

    /// Bytes of a chunk that are not data: length, type and CRC fields
    inline constexpr std::size_t chunk_overhead = 3 * chunk_field_size;

    /**
     * @class chunk
     * @brief Immutable PNG chunk
     *
     * A chunk built from parts always carries a freshly computed length and
     * CRC. A chunk decoded from bytes keeps the stored CRC, which has been
     * verified against the recomputed one.
     */
    class PNGCHAT_EXPORT chunk {
    public:
        /**
         * @brief Build a chunk from a type code and its data
         * @param type Chunk type code
         * @param data Chunk data (may be empty)
         * @throws malformed_chunk if @p data has 2^32 bytes or more
         */
        chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk from a type string and a text message
         * @param type Four-letter type code, e.g. "ruSt"
         * @param text Message stored verbatim as the chunk data
         * @throws invalid_type_code if @p type is not four ASCII letters
         */
        static chunk from_strings(std::string_view type, std::string_view text);

        /**
         * @brief Decode one chunk from a buffer holding exactly that chunk
         * @param data Pointer to the first byte of the length field
         * @param size Total size of the buffer
         * @throws malformed_chunk if @p size is not the declared length + 12
         * @throws invalid_type_code if the type field is not four ASCII letters
         * @throws checksum_mismatch if the stored CRC is wrong
         */
        static chunk from_bytes(const std::byte* data, std::size_t size);

        static chunk from_bytes(const std::vector<std::byte>& bytes) {
            return from_bytes(bytes.data(), bytes.size());
        }

        /// Number of data bytes
        [[nodiscard]] std::uint32_t length() const { return m_length; }

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /// Size on the wire including length, type and CRC fields
        [[nodiscard]] std::size_t total_size() const {
            return m_data.size() + chunk_overhead;
        }

        /**
         * @brief Interpret the data as UTF-8 text
         * @throws text_decode_error if the data is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Encode to the on-wire layout
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        /// Append the on-wire layout to @p out
        void write_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const {
            return m_crc == o.m_crc && m_type == o.m_type && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc);

        static std::uint32_t compute_crc(const chunk_type& type, const std::vector<std::byte>& data);

        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_length;
        std::uint32_t m_crc;
    };

    /// Multi-line diagnostic dump of a chunk
    PNGCHAT_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchat
