//
// pngchat commands
//

#include <pngchat/commands.hh>
#include <pngchat/chunk.hh>
#include <pngchat/exceptions.hh>
#include <pngchat/io.hh>
#include <pngchat/png.hh>

#include <ostream>

namespace pngchat {

    void encode(const encode_args& args, std::ostream& out, const parse_options& options) {
        png file = load_png(args.file_path, options);
        file.append_chunk(chunk::from_strings(args.chunk_type, args.message));

        const auto& target = args.output_file ? *args.output_file : args.file_path;
        save_png(target, file);
        out << "Encoded message into chunk " << args.chunk_type
            << ", saved to " << target.string() << "\n";
    }

    void decode(const decode_args& args, std::ostream& out, const parse_options& options) {
        png file = load_png(args.file_path, options);

        const chunk* found = file.chunk_by_type(args.chunk_type);
        if (!found) {
            THROW_NOT_FOUND("This file does not contain msg of chunk type ", args.chunk_type);
        }
        out << "msg: " << found->data_as_string() << "\n";
    }

    void remove(const remove_args& args, std::ostream& out, const parse_options& options) {
        png file = load_png(args.file_path, options);
        chunk removed = file.remove_chunk(args.chunk_type);
        save_png(args.file_path, file);
        out << "Removed chunk " << removed.type() << " (" << removed.length() << " bytes)\n";
    }

    void print_chunks(const print_args& args, std::ostream& out, const parse_options& options) {
        png file = load_png(args.file_path, options);
        out << "File: " << args.file_path.string() << ", Size: " << file.total_size() << "\n";

        std::size_t i = 0;
        for (const auto& c : file.chunks()) {
            out << "  chunk#" << i++ << "{ chunk_type: " << c.type()
                << ", data_length: " << c.length() << "}\n";
        }
    }

} // namespace pngchat
