//
// PNG chunk encoding and decoding
//

#include <pngchat/chunk.hh>
#include <pngchat/crc.hh>
#include <pngchat/exceptions.hh>
#include <cstring>
#include <ostream>

#include "input.hh"

namespace pngchat {

    namespace {
        // Returns the offset of the first byte that breaks UTF-8 or size if valid.
        // Rejects overlong forms, surrogates and code points above U+10FFFF.
        std::size_t find_invalid_utf8(const std::byte* data, std::size_t size) {
            std::size_t i = 0;
            while (i < size) {
                auto c = std::to_integer<unsigned>(data[i]);
                if (c < 0x80) {
                    ++i;
                    continue;
                }

                std::size_t need;
                unsigned lo = 0x80;
                unsigned hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) {
                    need = 1;
                } else if (c >= 0xE0 && c <= 0xEF) {
                    need = 2;
                    if (c == 0xE0) {
                        lo = 0xA0;
                    } else if (c == 0xED) {
                        hi = 0x9F;
                    }
                } else if (c >= 0xF0 && c <= 0xF4) {
                    need = 3;
                    if (c == 0xF0) {
                        lo = 0x90;
                    } else if (c == 0xF4) {
                        hi = 0x8F;
                    }
                } else {
                    return i;
                }

                if (size - i <= need) {
                    return i;
                }
                auto second = std::to_integer<unsigned>(data[i + 1]);
                if (second < lo || second > hi) {
                    return i;
                }
                for (std::size_t k = 2; k <= need; ++k) {
                    auto cont = std::to_integer<unsigned>(data[i + k]);
                    if (cont < 0x80 || cont > 0xBF) {
                        return i;
                    }
                }
                i += need + 1;
            }
            return size;
        }
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_type(type)
        , m_data(std::move(data))
        , m_length(checked_length(m_data.size()))
        , m_crc(compute_crc(m_type, m_data)) {
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc)
        : m_type(type)
        , m_data(std::move(data))
        , m_length(checked_length(m_data.size()))
        , m_crc(crc) {
    }

    std::uint32_t chunk::compute_crc(const chunk_type& type, const std::vector<std::byte>& data) {
        auto type_bytes = type.bytes();
        return crc_accumulator()
            .update(type_bytes.data(), type_bytes.size())
            .update(data.data(), data.size())
            .value();
    }

    chunk chunk::from_strings(std::string_view type, std::string_view text) {
        auto parsed = chunk_type::from_string(type);
        std::vector<std::byte> data(text.size());
        if (!text.empty()) {
            std::memcpy(data.data(), text.data(), text.size());
        }
        return {parsed, std::move(data)};
    }

    chunk chunk::from_bytes(const std::byte* data, std::size_t size) {
        reader in(data, size);

        std::uint64_t length = in.read_be32();
        if (size != length + chunk_overhead) {
            THROW_MALFORMED("Chunk contains incorrect length information: declared ", length,
                            " data bytes (", length + chunk_overhead, " bytes total) but got ",
                            size, " bytes");
        }

        chunk_type type = in.read_chunk_type();
        const std::byte* payload = in.read_exact(static_cast<std::size_t>(length));
        std::vector<std::byte> body(payload, payload + length);
        std::uint32_t stored_crc = in.read_be32();

        std::uint32_t actual_crc = compute_crc(type, body);
        if (actual_crc != stored_crc) {
            THROW_CHECKSUM("CRC checksum fails for chunk '", type, "': stored ", stored_crc,
                           ", computed ", actual_crc);
        }

        return {type, std::move(body), stored_crc};
    }

    std::string chunk::data_as_string() const {
        std::size_t bad = find_invalid_utf8(m_data.data(), m_data.size());
        if (bad != m_data.size()) {
            THROW_TEXT_DECODE("Data of chunk '", m_type, "' is not valid UTF-8: invalid sequence at byte ", bad);
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    void chunk::write_to(std::vector<std::byte>& out) const {
        std::size_t pos = out.size();
        out.resize(pos + total_size());
        std::byte* dst = out.data() + pos;

        store_be32(dst, length());
        dst += chunk_field_size;
        m_type.to_bytes(dst);
        dst += chunk_field_size;
        if (!m_data.empty()) {
            std::memcpy(dst, m_data.data(), m_data.size());
        }
        dst += m_data.size();
        store_be32(dst, m_crc);
    }

    std::vector<std::byte> chunk::as_bytes() const {
        std::vector<std::byte> out;
        out.reserve(total_size());
        write_to(out);
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n"
           << "  length: " << c.length() << ", chunk_type: " << c.type() << "\n"
           << "  data: " << c.data().size() << " bytes\n"
           << "  crc: " << c.crc() << "\n"
           << "}";
        return os;
    }

} // namespace pngchat
