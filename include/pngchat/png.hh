/**
 * @file png.hh
 * @brief A PNG file viewed as a signature followed by a sequence of chunks
 */

#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

#include <pngchat/chunk.hh>
#include <pngchat/parse_options.hh>
#include <pngchat/export_pngchat.h>

namespace pngchat {

    /// Fixed 8-byte prefix of every PNG file
    inline constexpr std::array<std::byte, 8> png_signature{
        std::byte{0x89}, std::byte{'P'}, std::byte{'N'}, std::byte{'G'},
        std::byte{'\r'}, std::byte{'\n'}, std::byte{0x1A}, std::byte{'\n'}
    };

    /**
     * @class png
     * @brief Ordered chunk sequence of one PNG file
     *
     * Chunks keep their on-disk order. Parsing and then serializing a file
     * reproduces it byte for byte. Pixel data is never decoded; every chunk
     * is carried as opaque bytes.
     */
    class PNGCHAT_EXPORT png {
    public:
        /**
         * @brief Build a file from already constructed chunks
         * @param chunks Chunks in file order
         */
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG file held in memory
         * @param data Pointer to the first byte of the signature
         * @param size Size of the buffer
         * @param options Size limit and warning callback
         * @throws bad_signature if the buffer does not start with the PNG signature
         * @throws malformed_chunk if a chunk's length disagrees with the buffer
         * @throws invalid_type_code if a chunk type is not four ASCII letters
         * @throws checksum_mismatch if a chunk CRC is wrong
         */
        static png from_bytes(const std::byte* data, std::size_t size, const parse_options& options);

        static png from_bytes(const std::byte* data, std::size_t size) {
            return from_bytes(data, size, parse_options{});
        }

        static png from_bytes(const std::vector<std::byte>& bytes, const parse_options& options) {
            return from_bytes(bytes.data(), bytes.size(), options);
        }

        static png from_bytes(const std::vector<std::byte>& bytes) {
            return from_bytes(bytes.data(), bytes.size(), parse_options{});
        }

        /// Add a chunk after the last one. Duplicated types are allowed.
        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk of the given type
         * @param type Four-letter type code
         * @return The removed chunk
         * @throws chunk_not_found if no chunk has that type; the file is left unchanged
         */
        chunk remove_chunk(std::string_view type);

        /**
         * @brief Find the first chunk of the given type
         * @param type Four-letter type code
         * @return Pointer to the chunk or nullptr if there is none
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        [[nodiscard]] const std::array<std::byte, 8>& header() const { return png_signature; }
        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t chunk_count() const { return m_chunks.size(); }

        /// Signature size plus the wire size of every chunk
        [[nodiscard]] std::size_t total_size() const;

        /// Serialize the whole file
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        bool operator==(const png& o) const { return m_chunks == o.m_chunks; }
        bool operator!=(const png& o) const { return !(*this == o); }

    private:
        std::vector<chunk> m_chunks;
    };

} // namespace pngchat
