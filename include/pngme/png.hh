/**
 * @file png.hh
 * @brief PNG file as a signature followed by an ordered list of chunks
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <array>
#include <iosfwd>
#include <vector>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/codec_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief Container of chunks forming a PNG file
     *
     * Chunks are kept opaque: image data is never decoded. The container
     * only locates, inserts and removes chunks and writes them back in order.
     */
    class PNGME_EXPORT png {
    public:
        /// The 8 bytes every PNG file starts with
        static constexpr std::array<std::uint8_t, 8> signature = {
            0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'
        };

        png() = default;
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Decode a complete PNG file held in memory
         * @throws parse_error(invalid_signature) if the signature is wrong,
         *         or any chunk::parse error (message carries the file offset)
         *
         * Decoding stops after IEND. Trailing bytes and a missing IEND are
         * reported through options.on_warning.
         */
        static png parse(const void* data, std::size_t size, const codec_options& options = {});

        static png parse(const std::vector<std::byte>& bytes, const codec_options& options = {});

        /**
         * @brief Read a whole stream and decode it
         * @throws io_error if the stream cannot be read
         */
        static png load(std::istream& is, const codec_options& options = {});

        /**
         * @brief Write the serialized file to a stream
         * @throws io_error if the stream cannot be written
         */
        void save(std::ostream& os) const;

        /**
         * @brief Add a chunk, placing it before IEND when there is one
         * @throws parse_error(invalid_tag_bits) if the chunk type is not valid,
         *         so the file written afterwards can be parsed back
         */
        void append_chunk(chunk c);

        /**
         * @brief Remove and return the first chunk of the given type
         * @throws parse_error(malformed_tag) if type is not 4 ASCII letters
         * @throws pngme_error(chunk_not_found) if no chunk has that type
         */
        chunk remove_first_chunk(std::string_view type);

        /**
         * @brief First chunk of the given type, nullptr if absent
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        [[nodiscard]] const std::array<std::uint8_t, 8>& header() const { return signature; }

        /// Signature followed by every chunk serialized in order
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

    private:
        std::vector<chunk> m_chunks;
    };

    // Multi-line listing of the chunks
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngme
