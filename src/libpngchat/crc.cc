//
// CRC-32 backed by zlib
//

#include <pngchat/crc.hh>

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngchat {

    crc_accumulator::crc_accumulator()
        : m_value(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {
    }

    crc_accumulator& crc_accumulator::update(const void* data, std::size_t size) {
        auto p = static_cast<const Bytef*>(data);
        uLong crc = m_value;
        // zlib takes uInt lengths
        while (size > 0) {
            auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            crc = ::crc32(crc, p, n);
            p += n;
            size -= n;
        }
        m_value = static_cast<std::uint32_t>(crc);
        return *this;
    }

    std::uint32_t crc_accumulator::compute(const void* data, std::size_t size) {
        return crc_accumulator().update(data, size).value();
    }

} // namespace pngchat
