/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngchat library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library. Every failure of a parse,
 * construct or lookup operation is reported by throwing one of these.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchat {

    /**
     * @class pngchat_error
     * @brief Base exception class for all pngchat errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every pngchat-specific error with a single catch block.
     */
    class pngchat_error : public std::runtime_error {
    public:
        explicit pngchat_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when a file cannot be opened, read or written.
     */
    class io_error : public pngchat_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchat_error(msg) {}
    };

    /**
     * @class invalid_type_code
     * @brief A chunk type code is not exactly four ASCII letters
     */
    class invalid_type_code : public pngchat_error {
    public:
        explicit invalid_type_code(const std::string& msg)
            : pngchat_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Base for failures while decoding chunk or file bytes
     */
    class parse_error : public pngchat_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngchat_error(msg) {}
    };

    /**
     * @class malformed_chunk
     * @brief Declared chunk length disagrees with the available bytes
     */
    class malformed_chunk : public parse_error {
    public:
        explicit malformed_chunk(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class checksum_mismatch
     * @brief Stored CRC differs from the CRC recomputed over type and data
     */
    class checksum_mismatch : public parse_error {
    public:
        explicit checksum_mismatch(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class bad_signature
     * @brief The buffer does not start with the PNG signature
     */
    class bad_signature : public parse_error {
    public:
        explicit bad_signature(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class chunk_not_found
     * @brief No chunk with the requested type code exists
     */
    class chunk_not_found : public pngchat_error {
    public:
        explicit chunk_not_found(const std::string& msg)
            : pngchat_error(msg) {}
    };

    /**
     * @class text_decode_error
     * @brief Chunk data is not valid UTF-8
     */
    class text_decode_error : public pngchat_error {
    public:
        explicit text_decode_error(const std::string& msg)
            : pngchat_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_IO(...) \
        throw ::pngchat::io_error(::pngchat::build_error_msg(__VA_ARGS__))

    #define THROW_INVALID_TYPE(...) \
        throw ::pngchat::invalid_type_code(::pngchat::build_error_msg(__VA_ARGS__))

    #define THROW_MALFORMED(...) \
        throw ::pngchat::malformed_chunk(::pngchat::build_error_msg(__VA_ARGS__))

    #define THROW_CHECKSUM(...) \
        throw ::pngchat::checksum_mismatch(::pngchat::build_error_msg(__VA_ARGS__))

    #define THROW_SIGNATURE(...) \
        throw ::pngchat::bad_signature(::pngchat::build_error_msg(__VA_ARGS__))

    #define THROW_NOT_FOUND(...) \
        throw ::pngchat::chunk_not_found(::pngchat::build_error_msg(__VA_ARGS__))

    #define THROW_TEXT_DECODE(...) \
        throw ::pngchat::text_decode_error(::pngchat::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_MALFORMED_IF
     * @brief Conditionally throw a malformed_chunk
     */
    #define THROW_MALFORMED_IF(condition, ...) \
        do { if (condition) THROW_MALFORMED(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchat
