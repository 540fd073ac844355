/**
 * @file crc.hh
 * @brief CRC-32 (ISO-HDLC) as used by PNG chunks
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <pngchat/export_pngchat.h>

namespace pngchat {

    /**
     * @class crc_accumulator
     * @brief Incremental CRC-32 accumulator
     *
     * Same polynomial and parameters as zlib and the PNG specification.
     * A chunk CRC is obtained by feeding the type code and then the data.
     */
    class PNGCHAT_EXPORT crc_accumulator {
    public:
        crc_accumulator();

        /**
         * @brief Feed more bytes into the checksum
         * @param data Bytes to add
         * @param size Number of bytes
         * @return Reference to this accumulator
         */
        crc_accumulator& update(const void* data, std::size_t size);

        /// Checksum of all bytes fed so far
        [[nodiscard]] std::uint32_t value() const { return m_value; }

        /// One-shot checksum of a buffer
        static std::uint32_t compute(const void* data, std::size_t size);

    private:
        std::uint32_t m_value;
    };

} // namespace pngchat
