/**
 * @file pngme.cpp
 * @brief Hide, reveal and remove messages in PNG files
 *
 * Each message lives in its own ancillary chunk, so the image itself
 * stays intact and viewable.
 */

#include <pngme/command.hh>
#include <pngme/png.hh>
#include <pngme/exceptions.hh>
#include <pngme/pngme_config.h>
#include <iostream>
#include <fstream>
#include <string>
#include <exception>

namespace {

    void usage(const char* prog) {
        std::cout << "pngme " << PNGME_VERSION_STRING << "\n\n";
        std::cout << "Usage:\n";
        std::cout << "  " << prog << " encode <file> <chunk type> <message> [output]\n";
        std::cout << "  " << prog << " decode <file> <chunk type>\n";
        std::cout << "  " << prog << " remove <file> <chunk type>\n";
        std::cout << "  " << prog << " print <file>\n";
        std::cout << "\n";
        std::cout << "Chunk types are 4 ASCII letters with an uppercase third letter, e.g. 'ruSt'.\n";
    }

    pngme::codec_options make_options() {
        pngme::codec_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };
        return options;
    }

    pngme::png read_png(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_IF(!file, "Cannot open file '", path, "'");
        return pngme::png::load(file, make_options());
    }

    void write_png(const pngme::png& image, const std::string& path) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_IF(!file, "Cannot create file '", path, "'");
        image.save(file);
    }

    void run_encode(const pngme::command& cmd) {
        pngme::chunk_type type(*cmd.type);
        auto image = read_png(cmd.file);
        image.append_chunk(pngme::chunk::from_text(type, *cmd.message));

        const std::string& target = cmd.output ? *cmd.output : cmd.file;
        write_png(image, target);
        std::cout << "Message stored in chunk " << type << " of " << target << "\n";
    }

    void run_decode(const pngme::command& cmd) {
        auto image = read_png(cmd.file);
        const pngme::chunk* found = image.chunk_by_type(*cmd.type);
        if (!found) {
            throw pngme::pngme_error(pngme::error_kind::chunk_not_found,
                                     "No chunk of type '" + *cmd.type + "' in " + cmd.file);
        }
        std::cout << found->data_as_string() << "\n";
    }

    void run_remove(const pngme::command& cmd) {
        auto image = read_png(cmd.file);
        auto removed = image.remove_first_chunk(*cmd.type);
        write_png(image, cmd.file);
        std::cout << "Removed " << removed << "\n";
    }

    void run_print(const pngme::command& cmd) {
        std::cout << read_png(cmd.file);
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    try {
        auto cmd = pngme::parse_command_line(argc, argv);
        switch (cmd.action) {
            case pngme::verb::encode:
                run_encode(cmd);
                break;
            case pngme::verb::decode:
                run_decode(cmd);
                break;
            case pngme::verb::remove:
                run_remove(cmd);
                break;
            case pngme::verb::print:
                run_print(cmd);
                break;
        }
    } catch (const pngme::argument_error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        usage(argv[0]);
        return 1;
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error (" << pngme::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
