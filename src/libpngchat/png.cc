//
// PNG chunk sequence parsing and serialization
//

#include <pngchat/png.hh>
#include <pngchat/exceptions.hh>
#include <algorithm>
#include <cstring>
#include <iterator>
#include <numeric>

#include "input.hh"

namespace pngchat {

    namespace {
        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }
    }

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::from_bytes(const std::byte* data, std::size_t size, const parse_options& options) {
        if (size < png_signature.size() ||
            std::memcmp(data, png_signature.data(), png_signature.size()) != 0) {
            THROW_SIGNATURE("Not a PNG file: the first ", png_signature.size(),
                            " bytes do not match the PNG signature");
        }

        reader in(data, size);
        in.read_exact(png_signature.size());

        std::vector<chunk> chunks;

        while (!in.at_end()) {
            std::size_t start_pos = in.tell();

            THROW_MALFORMED_IF(in.remaining() < chunk_overhead,
                               "Truncated chunk at offset ", start_pos, ": only ", in.remaining(),
                               " bytes left, a chunk needs at least ", chunk_overhead);

            std::uint32_t length = in.peek_be32();
            THROW_MALFORMED_IF(length > options.max_chunk_size,
                               "Chunk at offset ", start_pos, " has size ", length,
                               " bytes, which exceeds maximum allowed size of ",
                               options.max_chunk_size, " bytes");

            std::uint64_t total = std::uint64_t(length) + chunk_overhead;
            THROW_MALFORMED_IF(total > in.remaining(),
                               "Truncated chunk at offset ", start_pos, ": declares ", length,
                               " data bytes but only ", in.remaining() - chunk_overhead,
                               " are left in the file");

            const std::byte* raw = in.read_exact(static_cast<std::size_t>(total));
            chunk c = chunk::from_bytes(raw, static_cast<std::size_t>(total));

            if (!c.type().is_reserved_bit_valid()) {
                warn(options, start_pos, "reserved_bit",
                     "Chunk '" + c.type().to_string() + "' has the reserved bit set (lowercase third letter)");
            }

            chunks.push_back(std::move(c));
        }

        return png(std::move(chunks));
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png::remove_chunk(std::string_view type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type().to_string_view() == type;
        });
        if (it == m_chunks.end()) {
            THROW_NOT_FOUND("No chunk of type '", type, "' in this file");
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type().to_string_view() == type;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::size_t png::total_size() const {
        return std::accumulate(m_chunks.begin(), m_chunks.end(), png_signature.size(),
                               [](std::size_t sum, const chunk& c) { return sum + c.total_size(); });
    }

    std::vector<std::byte> png::as_bytes() const {
        std::vector<std::byte> out;
        out.reserve(total_size());
        out.insert(out.end(), png_signature.begin(), png_signature.end());
        for (const auto& c : m_chunks) {
            c.write_to(out);
        }
        return out;
    }

} // namespace pngchat
