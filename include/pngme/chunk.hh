/**
 * @file chunk.hh
 * @brief A single PNG chunk: type code, payload and checksum
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>
#include <pngme/codec_options.hh>
#include <pngme/exceptions.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief One length-prefixed, checksummed unit of a PNG file
     *
     * Serialized layout (all integers big-endian):
     * @code
     *   length (4) | type (4) | data (length) | crc (4)
     * @endcode
     * The CRC covers type and data, not the length field.
     *
     * A chunk is immutable. Constructing one directly does not validate
     * the type code; parse() validates everything it reads.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Size of the length, type and crc fields together
        static constexpr std::size_t overhead = 12;

        /// Largest payload the 32-bit length field can describe
        static constexpr std::uint64_t max_length = 0xFFFFFFFFu;

        /**
         * @brief Wrap a type code and a payload
         * @param type Chunk type, not validated
         * @param data Payload bytes, may be empty
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk whose payload is the bytes of a text
         */
        static chunk from_text(chunk_type type, std::string_view text);

        /**
         * @brief Decode one chunk from the start of an untrusted buffer
         * @param data Buffer holding at least one serialized chunk
         * @param size Number of bytes available
         * @param options Strictness, size limit and warning handler
         * @return The decoded chunk
         * @throws parse_error with kind too_short, malformed_tag,
         *         invalid_tag_bits, truncated_payload, payload_too_large
         *         or checksum_mismatch
         *
         * Bytes past the end of the chunk are ignored; serialized_size()
         * of the result tells how many were consumed.
         */
        static chunk parse(const void* data, std::size_t size, const codec_options& options = {});

        static chunk parse(const std::vector<std::byte>& bytes, const codec_options& options = {});

        /**
         * @brief Non-throwing variant of parse()
         * @param kind Receives the failure kind when parsing fails (may be null)
         * @return The decoded chunk, or nullopt on malformed input
         */
        static std::optional<chunk> try_parse(const void* data, std::size_t size,
                                              error_kind* kind = nullptr,
                                              const codec_options& options = {});

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }

        /**
         * @brief Payload size as stored in the length field
         * @throws parse_error(payload_too_large) if it does not fit 32 bits
         */
        [[nodiscard]] std::uint32_t length() const;

        /// CRC32 over type code and payload
        [[nodiscard]] std::uint32_t crc() const;

        /**
         * @brief Payload interpreted as UTF-8 text
         * @throws parse_error(invalid_chunk_data) if the type code is not
         *         valid or the payload is not well-formed UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Serialized form: length, type, data, crc
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        [[nodiscard]] std::size_t serialized_size() const { return overhead + m_data.size(); }

        bool operator==(const chunk& o) const { return m_type == o.m_type && m_data == o.m_data; }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::byte> m_data;
    };

    // One line summary: type, length and crc
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
