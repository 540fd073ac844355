/**
 * @file pngchat.cpp
 * @brief Command line tool that hides messages in PNG chunks
 *
 * Usage:
 *   pngchat encode <file> <chunk_type> <message> [output_file]
 *   pngchat decode <file> <chunk_type>
 *   pngchat remove <file> <chunk_type>
 *   pngchat print  <file>
 */

#include <pngchat/commands.hh>
#include <pngchat/exceptions.hh>
#include <pngchat/parse_options.hh>
#include <iostream>
#include <string>

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <command> [args]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  encode <file> <chunk_type> <message> [output_file]\n";
    std::cout << "      Hide a message in a new chunk of the given type\n";
    std::cout << "  decode <file> <chunk_type>\n";
    std::cout << "      Print the message stored in a chunk of the given type\n";
    std::cout << "  remove <file> <chunk_type>\n";
    std::cout << "      Remove the first chunk of the given type\n";
    std::cout << "  print <file>\n";
    std::cout << "      List the chunks of a PNG file\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << prog << " encode ./test.png ruSt \"This is a hidden message\"\n";
    std::cout << "  " << prog << " decode ./test.png ruSt\n";
}

static bool check_arity(const std::string& command, int argc, int min_args, int max_args, const char* prog) {
    int given = argc - 2;
    if (given < min_args || given > max_args) {
        std::cerr << "Error: wrong number of arguments for '" << command << "'\n\n";
        print_usage(prog);
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    pngchat::parse_options options;
    options.on_warning = [](std::uint64_t offset,
                            std::string_view category,
                            std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset
                  << ": " << message << "\n";
    };

    try {
        if (command == "encode") {
            if (!check_arity(command, argc, 3, 4, argv[0])) {
                return 1;
            }
            pngchat::encode_args args{argv[2], argv[3], argv[4], std::nullopt};
            if (argc == 6) {
                args.output_file = argv[5];
            }
            pngchat::encode(args, std::cout, options);
        } else if (command == "decode") {
            if (!check_arity(command, argc, 2, 2, argv[0])) {
                return 1;
            }
            pngchat::decode({argv[2], argv[3]}, std::cout, options);
        } else if (command == "remove") {
            if (!check_arity(command, argc, 2, 2, argv[0])) {
                return 1;
            }
            pngchat::remove({argv[2], argv[3]}, std::cout, options);
        } else if (command == "print") {
            if (!check_arity(command, argc, 1, 1, argv[0])) {
                return 1;
            }
            pngchat::print_chunks({argv[2]}, std::cout, options);
        } else {
            std::cerr << "Error: unknown command '" << command << "'\n\n";
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
