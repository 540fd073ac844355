/**
 * @file parse_options.hh
 * @brief Parsing options for PNG chunk sequences
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <limits>

namespace pngchat {

    /// Largest chunk data length allowed by the PNG specification (2^31 - 1)
    inline constexpr std::uint32_t png_max_chunk_length = 0x7FFFFFFFu;

    /// Largest length the 4-byte length field can carry
    inline constexpr std::uint32_t wire_max_chunk_length = std::numeric_limits<std::uint32_t>::max();

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG files
     *
     * Controls the size limit applied to each chunk and receives
     * non-fatal observations made while parsing.
     */
    struct parse_options {
        /**
         * @brief Maximum allowed chunk data length in bytes
         *
         * A chunk declaring more than this is rejected with malformed_chunk
         * before any of its data is copied. The default accepts every length
         * the wire format can express; set png_max_chunk_length to enforce
         * the PNG limit.
         */
        std::uint32_t max_chunk_size = wire_max_chunk_length;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset of the chunk the warning is about
         * @param category Warning category ("reserved_bit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored. Warnings never change
         * the result of a parse.
         */
        warning_handler on_warning;
    };

} // namespace pngchat
