#include <doctest/doctest.h>
#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>

#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngme;

namespace {
    chunk testing_chunk() {
        auto bytes = raw_chunk(42, "RuSt", secret_message, secret_message_crc);
        return chunk::parse(bytes);
    }

    error_kind parse_failure(const std::vector<std::byte>& bytes, const codec_options& opts = {}) {
        error_kind kind = error_kind::io_failure;
        auto result = chunk::try_parse(bytes.data(), bytes.size(), &kind, opts);
        REQUIRE_FALSE(result.has_value());
        return kind;
    }
}

TEST_SUITE("CHUNK") {
    TEST_CASE("chunk construction") {
        chunk c(chunk_type("RuSt"), to_bytes(secret_message));
        CHECK(c.length() == 42);
        CHECK(c.crc() == secret_message_crc);
        CHECK(c.type() == chunk_type("RuSt"));
        CHECK(c.data() == to_bytes(secret_message));

        SUBCASE("from text") {
            CHECK(chunk::from_text(chunk_type("RuSt"), secret_message) == c);
        }

        SUBCASE("empty payload") {
            chunk empty(chunk_id::IEND, {});
            CHECK(empty.length() == 0);
            CHECK(empty.crc() == 0xAE426082u);
            CHECK(empty.serialized_size() == 12);
        }

        SUBCASE("invalid type is accepted on construction") {
            chunk odd(chunk_type("Rust"), to_bytes("payload"));
            CHECK(odd.length() == 7);
            CHECK_FALSE(odd.type().is_valid());
            CHECK(odd.as_bytes().size() == 19);
        }
    }

    TEST_CASE("chunk parsed from bytes") {
        chunk c = testing_chunk();
        CHECK(c.length() == 42);
        CHECK(c.type().to_string() == "RuSt");
        CHECK(c.data_as_string() == secret_message);
        CHECK(c.crc() == secret_message_crc);
    }

    TEST_CASE("chunk serialization") {
        chunk c(chunk_type("RuSt"), to_bytes(secret_message));
        auto bytes = c.as_bytes();

        CHECK(bytes.size() == 54);
        CHECK(bytes == raw_chunk(42, "RuSt", secret_message, secret_message_crc));

        SUBCASE("length and crc are big-endian") {
            CHECK(bytes[0] == std::byte(0));
            CHECK(bytes[3] == std::byte(42));
            // 2882656334 = 0xABD1D84E
            CHECK(bytes[50] == std::byte(0xAB));
            CHECK(bytes[51] == std::byte(0xD1));
            CHECK(bytes[52] == std::byte(0xD8));
            CHECK(bytes[53] == std::byte(0x4E));
        }

        SUBCASE("round trip") {
            auto parsed = chunk::parse(bytes);
            CHECK(parsed == c);
            CHECK(parsed.crc() == c.crc());
            CHECK(parsed.as_bytes() == bytes);
        }

        SUBCASE("binary payload round trips untouched") {
            std::vector<std::byte> binary;
            for (int i = 0; i < 256; i++) {
                binary.push_back(std::byte(i));
            }
            chunk bin(chunk_type("biNa"), binary);
            auto parsed = chunk::parse(bin.as_bytes());
            CHECK(parsed.data() == binary);
            CHECK_THROWS_AS((void)parsed.data_as_string(), parse_error);
        }

        SUBCASE("trailing bytes are ignored") {
            auto extended = bytes;
            extended.push_back(std::byte(0xEE));
            extended.push_back(std::byte(0xFF));
            auto parsed = chunk::parse(extended);
            CHECK(parsed == c);
            CHECK(parsed.serialized_size() == bytes.size());
        }
    }

    TEST_CASE("chunk parse failures") {
        SUBCASE("wrong crc") {
            auto bytes = raw_chunk(42, "RuSt", secret_message, secret_message_crc - 1);
            CHECK(parse_failure(bytes) == error_kind::checksum_mismatch);
            CHECK_THROWS_AS(chunk::parse(bytes), parse_error);
        }

        SUBCASE("too short") {
            auto bytes = raw_chunk("RuSt", "");
            bytes.pop_back();
            CHECK(parse_failure(bytes) == error_kind::too_short);
            CHECK(parse_failure({}) == error_kind::too_short);
        }

        SUBCASE("malformed type") {
            CHECK(parse_failure(raw_chunk("Ru1t", "abc")) == error_kind::malformed_tag);
            CHECK(parse_failure(raw_chunk(std::string_view("R\0St", 4), "abc")) == error_kind::malformed_tag);
        }

        SUBCASE("reserved bit") {
            // Length and crc are correct, only the type is rejected
            CHECK(parse_failure(raw_chunk("Rust", "abc")) == error_kind::invalid_tag_bits);
        }

        SUBCASE("declared length larger than buffer") {
            auto bytes = raw_chunk(43, "RuSt", secret_message, secret_message_crc);
            CHECK(parse_failure(bytes) == error_kind::truncated_payload);

            auto huge = raw_chunk(0xFFFFFFFFu, "RuSt", "", 0);
            CHECK(parse_failure(huge) == error_kind::truncated_payload);
        }

        SUBCASE("declared length above configured limit") {
            codec_options opts;
            opts.max_chunk_size = 16;
            auto bytes = raw_chunk("RuSt", secret_message);
            CHECK(parse_failure(bytes, opts) == error_kind::payload_too_large);
            CHECK_NOTHROW((void)chunk::parse(raw_chunk("RuSt", "short"), opts));
        }

        SUBCASE("checks run in order") {
            // Malformed type and bad crc: the type is reported
            CHECK(parse_failure(raw_chunk(3, "Ru1t", "abc", 0)) == error_kind::malformed_tag);
            // Bad reserved bit and truncated payload: the type is reported
            CHECK(parse_failure(raw_chunk(100, "Rust", "abc", 0)) == error_kind::invalid_tag_bits);
            // Truncated payload and bad crc: the length is reported
            CHECK(parse_failure(raw_chunk(100, "RuSt", "abc", 0)) == error_kind::truncated_payload);
        }
    }

    TEST_CASE("chunk tamper detection") {
        auto original = raw_chunk("RuSt", secret_message);

        SUBCASE("every bit of the payload") {
            for (std::size_t i = 8; i < 8 + secret_message.size(); i++) {
                for (int bit = 0; bit < 8; bit++) {
                    auto bytes = original;
                    bytes[i] ^= std::byte(1 << bit);
                    CAPTURE(i);
                    CAPTURE(bit);
                    CHECK(parse_failure(bytes) == error_kind::checksum_mismatch);
                }
            }
        }

        SUBCASE("case bits of the type") {
            // Flipping bit 5 keeps a letter a letter; byte 2 would break the reserved bit
            for (std::size_t i : {4, 5, 7}) {
                auto bytes = original;
                bytes[i] ^= std::byte(0x20);
                CAPTURE(i);
                CHECK(parse_failure(bytes) == error_kind::checksum_mismatch);
            }
        }
    }

    TEST_CASE("chunk data as text") {
        SUBCASE("valid type and UTF-8 payload") {
            auto c = chunk::from_text(chunk_type("ruSt"), "z\xC3\xBCrich \xE2\x82\xAC \xF0\x9F\x98\x80");
            CHECK(c.data_as_string() == "z\xC3\xBCrich \xE2\x82\xAC \xF0\x9F\x98\x80");
        }

        SUBCASE("empty payload") {
            CHECK(chunk(chunk_type("ruSt"), {}).data_as_string().empty());
        }

        SUBCASE("invalid type") {
            chunk c(chunk_type("Rust"), to_bytes("hello"));
            try {
                (void)c.data_as_string();
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.kind() == error_kind::invalid_chunk_data);
            }
        }

        SUBCASE("payload that is not UTF-8") {
            for (std::string_view bad : {std::string_view("\xFF"),
                                         std::string_view("\xC0\xAF"),          // overlong '/'
                                         std::string_view("\xED\xA0\x80"),      // surrogate
                                         std::string_view("\xF4\x90\x80\x80"),  // above U+10FFFF
                                         std::string_view("abc\xE2\x82"),       // cut sequence
                                         std::string_view("\x80")}) {
                chunk c(chunk_type("ruSt"), to_bytes(bad));
                CAPTURE(bad);
                CHECK_THROWS_AS((void)c.data_as_string(), parse_error);
                CHECK(c.data() == to_bytes(bad));
            }
        }
    }

    TEST_CASE("chunk stream output") {
        std::stringstream ss;
        ss << testing_chunk();
        CHECK(ss.str() == "Chunk 'RuSt' (42 bytes, crc 0xabd1d84e)");
    }
}
