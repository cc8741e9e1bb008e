/**
 * @file command.hh
 * @brief Command line model for the pngme tool
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <pngme/export_pngme.h>

namespace pngme {

    enum class verb {
        encode, ///< Hide a message in a new chunk
        decode, ///< Print the message stored in a chunk
        remove, ///< Delete the first chunk of a type
        print   ///< List every chunk of the file
    };

    /**
     * @struct command
     * @brief Fully checked command, ready to dispatch
     *
     * type is present for encode, decode and remove; message only
     * for encode. output is optional for encode (defaults to file).
     */
    struct command {
        verb action = verb::print;
        std::string file;
        std::optional<std::string> type;
        std::optional<std::string> message;
        std::optional<std::string> output;
    };

    /**
     * @brief Build a command from a verb name and its arguments
     * @throws argument_error(invalid_command) for an unknown verb
     * @throws argument_error(missing_argument) naming "chunk type" or
     *         "message" when a required argument is absent
     * @throws parse_error(malformed_tag) or parse_error(invalid_tag_bits)
     *         when encode is given a chunk type that could not be read back
     *
     * Other verbs only need the type to name an existing chunk, so it is
     * validated when the lookup turns it into a chunk_type.
     */
    PNGME_EXPORT command make_command(std::string_view verb_name,
                                      std::string_view file,
                                      std::optional<std::string_view> type = std::nullopt,
                                      std::optional<std::string_view> message = std::nullopt,
                                      std::optional<std::string_view> output = std::nullopt);

    /**
     * @brief Build a command from main() arguments
     *
     * Expects: <verb> <file> [chunk type] [message] [output]
     * @throws argument_error(missing_argument) when verb or file is absent
     */
    PNGME_EXPORT command parse_command_line(int argc, const char* const* argv);

    PNGME_EXPORT std::string_view to_string(verb v) noexcept;

} // namespace pngme
