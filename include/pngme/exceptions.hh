/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the error kinds, the exception hierarchy and the
 * convenience macros used for error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @enum error_kind
     * @brief Classification of every failure the library reports
     */
    enum class error_kind {
        malformed_tag,       ///< Tag bytes are not 4 ASCII letters
        invalid_tag_bits,    ///< Tag letters violate the reserved-bit rule
        too_short,           ///< Fewer bytes than the minimal chunk
        truncated_payload,   ///< Declared length exceeds available bytes
        checksum_mismatch,   ///< Stored CRC disagrees with the computed one
        invalid_chunk_data,  ///< Payload cannot be interpreted as text
        payload_too_large,   ///< Payload does not fit the length field or limit
        invalid_signature,   ///< Byte stream is not a PNG file
        chunk_not_found,     ///< Container has no chunk of requested type
        invalid_command,     ///< Unknown command verb
        missing_argument,    ///< Command lacks a required argument
        io_failure           ///< Stream could not be read or written
    };

    /**
     * @brief Stable name of an error kind (e.g. "checksum_mismatch")
     */
    PNGME_EXPORT std::string_view to_string(error_kind kind) noexcept;

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all pngme-specific errors with a single catch block.
     * The kind tells callers which invariant was violated without
     * having to inspect the message.
     */
    class PNGME_EXPORT pngme_error : public std::runtime_error {
    public:
        pngme_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading or writing a stream fails.
     */
    class PNGME_EXPORT io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(error_kind::io_failure, msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for malformed chunk or container data
     *
     * Thrown when bytes handed to the codec violate the chunk layout,
     * the tag rules, the checksum, or the PNG container structure.
     */
    class PNGME_EXPORT parse_error : public pngme_error {
    public:
        parse_error(error_kind kind, const std::string& msg)
            : pngme_error(kind, msg) {}
    };

    /**
     * @class argument_error
     * @brief Exception for invalid command line arguments
     */
    class PNGME_EXPORT argument_error : public pngme_error {
    public:
        argument_error(error_kind kind, const std::string& msg)
            : pngme_error(kind, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
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

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error of the given kind with formatted message
     */
    #define THROW_PARSE(kind, ...) \
        throw ::pngme::parse_error(kind, ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_ARGUMENT
     * @brief Throw an argument_error of the given kind with formatted message
     */
    #define THROW_ARGUMENT(kind, ...) \
        throw ::pngme::argument_error(kind, ::pngme::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, kind, ...) \
        do { if (condition) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    #define THROW_PARSE_UNLESS(condition, kind, ...) \
        do { if (!(condition)) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
