/**
 * @file commands.hh
 * @brief The user-level operations of the pngchat tool
 *
 * Each command loads a PNG file, performs one chunk operation and, when
 * the file was modified, writes it back. Results are printed to the
 * given stream; failures are reported by throwing.
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include <pngchat/parse_options.hh>
#include <pngchat/export_pngchat.h>

namespace pngchat {

    struct encode_args {
        std::filesystem::path file_path;                   ///< PNG file to read
        std::string chunk_type;                            ///< Type code of the message chunk
        std::string message;                               ///< Text to hide
        std::optional<std::filesystem::path> output_file;  ///< Where to save; input file when absent
    };

    struct decode_args {
        std::filesystem::path file_path;
        std::string chunk_type;
    };

    struct remove_args {
        std::filesystem::path file_path;
        std::string chunk_type;
    };

    struct print_args {
        std::filesystem::path file_path;
    };

    /**
     * @brief Append a message chunk and save the file
     * @throws invalid_type_code if the chunk type is malformed
     */
    PNGCHAT_EXPORT void encode(const encode_args& args, std::ostream& out,
                               const parse_options& options = {});

    /**
     * @brief Print the message stored in the first chunk of the given type
     *
     * Prints "msg: <text>".
     * @throws chunk_not_found if the file has no chunk of that type
     * @throws text_decode_error if the chunk data is not UTF-8
     */
    PNGCHAT_EXPORT void decode(const decode_args& args, std::ostream& out,
                               const parse_options& options = {});

    /**
     * @brief Remove the first chunk of the given type and save the file in place
     * @throws chunk_not_found if the file has no chunk of that type
     */
    PNGCHAT_EXPORT void remove(const remove_args& args, std::ostream& out,
                               const parse_options& options = {});

    /// List every chunk with its type and data length
    PNGCHAT_EXPORT void print_chunks(const print_args& args, std::ostream& out,
                                     const parse_options& options = {});

} // namespace pngchat
