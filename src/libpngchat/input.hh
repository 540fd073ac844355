//
// Bounds-checked cursor over an in-memory PNG buffer
//

#pragma once

#include <array>
#include <cassert>
#include <cstdint>
#include <cstddef>
#include <cstring>

#include <pngchat/exceptions.hh>
#include <pngchat/endian.hh>
#include <pngchat/chunk_type.hh>
#include <pngchat/parse_options.hh>

namespace pngchat {

    // Copy a slice already known to be exactly 4 bytes long
    inline std::array<std::byte, chunk_field_size> to_array4(const std::byte* data, std::size_t size) {
        assert(size == chunk_field_size && "slice must be exactly 4 bytes");
        std::array<std::byte, chunk_field_size> out;
        std::memcpy(out.data(), data, chunk_field_size);
        return out;
    }

    // Data size as a wire length field; the field is 32 bits wide
    inline std::uint32_t checked_length(std::size_t size) {
        THROW_MALFORMED_IF(std::uint64_t(size) > wire_max_chunk_length,
                           "Chunk data of ", size, " bytes does not fit the 32-bit length field (maximum ",
                           wire_max_chunk_length, " bytes)");
        return static_cast<std::uint32_t>(size);
    }

    // Reads from a borrowed buffer - throws malformed_chunk on overrun
    class reader {
        public:
            reader(const std::byte* data, std::size_t size)
                : m_data(data), m_size(size), m_position(0) {}

            // Borrow the next n bytes and advance past them
            const std::byte* read_exact(std::size_t n) {
                const std::byte* p = peek(n);
                m_position += n;
                return p;
            }

            // Borrow the next n bytes without advancing
            [[nodiscard]] const std::byte* peek(std::size_t n) const {
                THROW_MALFORMED_IF(n > remaining(), "Unexpected end of data at offset ", m_position,
                                   ": requested ", n, " bytes, only ", remaining(), " left");
                return m_data + m_position;
            }

            std::uint32_t read_be32() {
                return load_be32(to_array4(read_exact(chunk_field_size), chunk_field_size).data());
            }

            [[nodiscard]] std::uint32_t peek_be32() const {
                return load_be32(peek(chunk_field_size));
            }

            chunk_type read_chunk_type() {
                return chunk_type(to_array4(read_exact(chunk_field_size), chunk_field_size));
            }

            [[nodiscard]] std::size_t tell() const { return m_position; }
            [[nodiscard]] std::size_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
