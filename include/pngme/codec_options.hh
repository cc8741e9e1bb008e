/**
 * @file codec_options.hh
 * @brief Options controlling how untrusted chunk bytes are decoded
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct codec_options
     * @brief Configuration options for decoding chunks and PNG files
     *
     * Controls strictness, size limits, and warning handling.
     */
    struct codec_options {
        /**
         * @brief Strict decoding mode
         *
         * When true, a chunk type with the reserved bit unset is rejected.
         * When false, such chunks are reported through on_warning and
         * accepted. All other checks are fatal in both modes.
         */
        bool strict = true;

        /**
         * @brief Maximum accepted payload size in bytes
         *
         * Declared lengths above this fail with payload_too_large.
         * Default is the full range of the 32-bit length field.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Byte offset where the warning occurred
         * @param category Warning category (e.g., "reserved_bit", "trailing_data")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during decoding.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
