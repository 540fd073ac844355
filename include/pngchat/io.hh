/**
 * @file io.hh
 * @brief Reading and writing PNG files from streams and paths
 */

#pragma once

#include <iosfwd>
#include <filesystem>
#include <vector>
#include <cstddef>

#include <pngchat/png.hh>
#include <pngchat/parse_options.hh>
#include <pngchat/export_pngchat.h>

namespace pngchat {

    /**
     * @brief Read everything left in a stream
     * @param is Input stream, opened in binary mode
     * @return All remaining bytes
     * @throws io_error if the stream fails before reaching its end
     */
    PNGCHAT_EXPORT std::vector<std::byte> read_all(std::istream& is);

    /**
     * @brief Read and parse a PNG file from a stream
     * @throws io_error on read failure; parse errors propagate from png::from_bytes
     */
    PNGCHAT_EXPORT png read_png(std::istream& is, const parse_options& options = {});

    /**
     * @brief Read and parse a PNG file from disk
     * @throws io_error if the file cannot be opened or read
     */
    PNGCHAT_EXPORT png load_png(const std::filesystem::path& path, const parse_options& options = {});

    /**
     * @brief Serialize a PNG into a stream
     * @throws io_error if writing fails
     */
    PNGCHAT_EXPORT void write_png(std::ostream& os, const png& file);

    /**
     * @brief Serialize a PNG and write it to disk, replacing any existing file
     *
     * The bytes go to "<path>.tmp" first, which is then renamed over @p path.
     * On failure the staging file is removed and @p path is left as it was.
     * @throws io_error if the file cannot be created, written or replaced
     */
    PNGCHAT_EXPORT void save_png(const std::filesystem::path& path, const png& file);

} // namespace pngchat
