/**
 * @file chunk_type.hh
 * @brief Four-letter PNG chunk type code
 *
 * Type codes are restricted to uppercase and lowercase ASCII letters.
 * They are compared as fixed binary values; the case of each letter
 * carries one property bit of the chunk.
 */

#pragma once

#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>

#include <pngchat/exceptions.hh>

namespace pngchat {
    /// Size of the length, type and CRC fields of a chunk
    inline constexpr std::size_t chunk_field_size = 4;

    class chunk_type {
        public:
            // Constructor from 4 individual chars, throws invalid_type_code
            chunk_type(char c0, char c1, char c2, char c3)
                : m_b{c0, c1, c2, c3} {
                validate();
            }

            // Constructor from 4 raw bytes, throws invalid_type_code
            explicit chunk_type(const std::array<std::byte, chunk_field_size>& bytes) {
                std::memcpy(m_b.data(), bytes.data(), chunk_field_size);
                validate();
            }

            // Parse text form, e.g. "ruSt"
            static chunk_type from_string(std::string_view sv) {
                if (sv.size() != chunk_field_size) {
                    THROW_INVALID_TYPE("Invalid length of chunk type: expected ", chunk_field_size,
                                       " bytes, got ", sv.size());
                }
                return {sv[0], sv[1], sv[2], sv[3]};
            }

            // Read 4 raw bytes from memory
            static chunk_type from_bytes(const void* data) {
                std::array<std::byte, chunk_field_size> raw;
                std::memcpy(raw.data(), data, chunk_field_size);
                return chunk_type(raw);
            }

            [[nodiscard]] static bool is_type_letter(char c) {
                return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
            }

            [[nodiscard]] std::array<std::byte, chunk_field_size> bytes() const {
                std::array<std::byte, chunk_field_size> out;
                std::memcpy(out.data(), m_b.data(), chunk_field_size);
                return out;
            }

            // Write to bytes
            void to_bytes(void* dest) const {
                std::memcpy(dest, m_b.data(), chunk_field_size);
            }

            [[nodiscard]] std::string to_string() const {
                return {m_b.data(), chunk_field_size};
            }

            [[nodiscard]] std::string_view to_string_view() const {
                return {m_b.data(), chunk_field_size};
            }

            char operator[](std::size_t i) const { return m_b[i]; }

            [[nodiscard]] auto begin() const { return m_b.begin(); }
            [[nodiscard]] auto end() const { return m_b.end(); }

            // Ancillary bit (bit 5 of byte 0): uppercase means critical
            [[nodiscard]] bool is_critical() const { return is_upper(m_b[0]); }

            // Private bit (bit 5 of byte 1): uppercase means public
            [[nodiscard]] bool is_public() const { return is_upper(m_b[1]); }

            // Reserved bit (bit 5 of byte 2): must be uppercase in current PNG
            [[nodiscard]] bool is_reserved_bit_valid() const { return is_upper(m_b[2]); }

            // Safe-to-copy bit (bit 5 of byte 3): lowercase means safe to copy
            [[nodiscard]] bool is_safe_to_copy() const { return !is_upper(m_b[3]); }

            // Private and conforming to the reserved-bit rule. Message chunks
            // written by this tool are expected to use such codes.
            [[nodiscard]] bool is_valid() const {
                return !is_public() && is_reserved_bit_valid();
            }

            bool operator==(const chunk_type& o) const { return m_b == o.m_b; }
            bool operator!=(const chunk_type& o) const { return !(*this == o); }
            bool operator<(const chunk_type& o) const { return m_b < o.m_b; }

            friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
                return os.write(t.m_b.data(), chunk_field_size);
            }

        private:
            static bool is_upper(char c) {
                return c >= 'A' && c <= 'Z';
            }

            void validate() const {
                auto bad = std::find_if_not(m_b.begin(), m_b.end(), is_type_letter);
                if (bad != m_b.end()) {
                    THROW_INVALID_TYPE("Invalid chunk type byte ",
                                       static_cast<unsigned>(static_cast<unsigned char>(*bad)),
                                       " at position ", bad - m_b.begin(),
                                       ": type codes must consist of ASCII letters");
                }
            }

            std::array<char, chunk_field_size> m_b;
    };

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            t.to_bytes(&v);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchat::chunk_type> {
        std::size_t operator()(const pngchat::chunk_type& t) const noexcept {
            return pngchat::chunk_type_hash{}(t);
        }
    };
}
