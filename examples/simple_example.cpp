/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic pngchat usage
 *
 * This is a minimal example showing how to parse a PNG file
 * and print information about its chunks.
 */

#include <pngchat/io.hh>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file.png>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    try {
        auto file = pngchat::load_png(argv[1]);

        for (const auto& chunk : file.chunks()) {
            const auto& type = chunk.type();
            std::cout << "Chunk: " << type << " (" << chunk.length() << " bytes)"
                      << (type.is_critical() ? " critical" : " ancillary")
                      << (type.is_public() ? " public" : " private")
                      << (type.is_safe_to_copy() ? " safe-to-copy" : "") << "\n";
        }

        std::cout << "\n" << file.chunk_count() << " chunks, "
                  << file.total_size() << " bytes\n";
        std::cout << "Parsing completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
