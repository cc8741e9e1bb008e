//
// Created by igor on 16/08/2025.
//

#include <pngme/command.hh>
#include <pngme/exceptions.hh>
#include <pngme/chunk_type.hh>

namespace pngme {

    namespace {
        std::optional<std::string> to_owned(std::optional<std::string_view> sv) {
            if (!sv) {
                return std::nullopt;
            }
            return std::string(*sv);
        }

        std::optional<std::string_view> arg_at(int argc, const char* const* argv, int index) {
            if (index < argc && argv[index]) {
                return std::string_view(argv[index]);
            }
            return std::nullopt;
        }
    }

    command make_command(std::string_view verb_name,
                         std::string_view file,
                         std::optional<std::string_view> type,
                         std::optional<std::string_view> message,
                         std::optional<std::string_view> output) {
        command cmd;
        cmd.file = std::string(file);

        if (verb_name == "encode") {
            cmd.action = verb::encode;
        } else if (verb_name == "decode") {
            cmd.action = verb::decode;
        } else if (verb_name == "remove") {
            cmd.action = verb::remove;
        } else if (verb_name == "print") {
            cmd.action = verb::print;
        } else {
            THROW_ARGUMENT(error_kind::invalid_command, "Unknown command '", verb_name,
                           "', expected encode, decode, remove or print");
        }

        if (cmd.action != verb::print && !type) {
            THROW_ARGUMENT(error_kind::missing_argument, "Missing argument: chunk type");
        }
        if (cmd.action == verb::encode && !message) {
            THROW_ARGUMENT(error_kind::missing_argument, "Missing argument: message");
        }

        if (cmd.action == verb::encode) {
            // A tag that parse() would reject must never reach the output file
            chunk_type tag(*type);
            THROW_PARSE_UNLESS(tag.is_valid(), error_kind::invalid_tag_bits,
                               "invalid chunk type ", tag, ": reserved bit not set");
        }

        cmd.type = to_owned(type);
        if (cmd.action == verb::encode) {
            cmd.message = to_owned(message);
            cmd.output = to_owned(output);
        }
        return cmd;
    }

    command parse_command_line(int argc, const char* const* argv) {
        auto verb_name = arg_at(argc, argv, 1);
        if (!verb_name) {
            THROW_ARGUMENT(error_kind::missing_argument, "Missing argument: command");
        }
        auto file = arg_at(argc, argv, 2);
        if (!file) {
            THROW_ARGUMENT(error_kind::missing_argument, "Missing argument: file");
        }
        return make_command(*verb_name, *file,
                            arg_at(argc, argv, 3),
                            arg_at(argc, argv, 4),
                            arg_at(argc, argv, 5));
    }

    std::string_view to_string(verb v) noexcept {
        switch (v) {
            case verb::encode:
                return "encode";
            case verb::decode:
                return "decode";
            case verb::remove:
                return "remove";
            case verb::print:
                return "print";
        }
        // make compiler happy
        return "unknown";
    }

} // namespace pngme
