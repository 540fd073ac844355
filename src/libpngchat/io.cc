//
// Stream and file access for PNG chunk sequences
//

#include <pngchat/io.hh>
#include <pngchat/exceptions.hh>

#include <array>
#include <fstream>
#include <istream>
#include <system_error>
#include <ostream>

namespace pngchat {

    std::vector<std::byte> read_all(std::istream& is) {
        THROW_IO_UNLESS(is.good(), "Stream in bad state");

        std::vector<std::byte> result;
        std::array<char, 64 * 1024> buffer;
        while (is) {
            is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = static_cast<std::size_t>(is.gcount());
            const auto* first = reinterpret_cast<const std::byte*>(buffer.data());
            result.insert(result.end(), first, first + got);
        }

        THROW_IO_IF(is.bad(), "Stream read failed after ", result.size(), " bytes");
        return result;
    }

    png read_png(std::istream& is, const parse_options& options) {
        return png::from_bytes(read_all(is), options);
    }

    png load_png(const std::filesystem::path& path, const parse_options& options) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Cannot open file '", path.string(), "' for reading");

        std::vector<std::byte> data;
        try {
            data = read_all(file);
        } catch (const io_error& e) {
            THROW_IO("Failed to read '", path.string(), "': ", e.what());
        }
        return png::from_bytes(data, options);
    }

    void write_png(std::ostream& os, const png& file) {
        auto bytes = file.as_bytes();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(os, "Stream write failed after ", bytes.size(), " bytes requested");
    }

    void save_png(const std::filesystem::path& path, const png& file) {
        // Stage beside the target so the rename stays on one filesystem
        std::filesystem::path staging = path;
        staging += ".tmp";

        try {
            {
                std::ofstream out(staging, std::ios::binary | std::ios::trunc);
                THROW_IO_UNLESS(out, "Cannot open file '", staging.string(), "' for writing");
                write_png(out, file);
                out.close();
                THROW_IO_UNLESS(out, "Close failed");
            }

            std::error_code ec;
            std::filesystem::rename(staging, path, ec);
            THROW_IO_IF(ec, "Cannot replace it with '", staging.string(), "': ", ec.message());
        } catch (const io_error& e) {
            std::error_code ignored;
            std::filesystem::remove(staging, ignored);
            THROW_IO("Failed to write '", path.string(), "': ", e.what());
        }
    }

} // namespace pngchat
