//
// Created by igor on 14/08/2025.
//

#include <pngme/exceptions.hh>

namespace pngme {

    std::string_view to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::malformed_tag:
                return "malformed_tag";
            case error_kind::invalid_tag_bits:
                return "invalid_tag_bits";
            case error_kind::too_short:
                return "too_short";
            case error_kind::truncated_payload:
                return "truncated_payload";
            case error_kind::checksum_mismatch:
                return "checksum_mismatch";
            case error_kind::invalid_chunk_data:
                return "invalid_chunk_data";
            case error_kind::payload_too_large:
                return "payload_too_large";
            case error_kind::invalid_signature:
                return "invalid_signature";
            case error_kind::chunk_not_found:
                return "chunk_not_found";
            case error_kind::invalid_command:
                return "invalid_command";
            case error_kind::missing_argument:
                return "missing_argument";
            case error_kind::io_failure:
                return "io_failure";
        }
        // make compiler happy
        return "unknown";
    }

} // namespace pngme
