#include "codec/decode_status.hpp"

#include <fmt/format.h>

namespace orderkv::codec {

    auto DecodeStatus::to_string() const -> std::string {
        if (ok())
            return "OK";

        std::string location;
        if (!field_path_.empty()) {
            location = fmt::format(" at field {}", fmt::join(field_path_, "."));
        }
        if (in_header_) {
            location += " (length header)";
        }

        switch (code_) {
        case DecodeCode::DataTooShort:
            return fmt::format("DataTooShort{}: expected {} bytes, got {}", location,
                               too_short_.expected, too_short_.actual);
        case DecodeCode::InvalidUtf8:
            return fmt::format("InvalidUtf8{}: {}", location, msg_);
        case DecodeCode::MissingNul:
            return fmt::format("MissingNul{}: {}", location, msg_);
        default:
            return fmt::format("Unknown{}", location);
        }
    }

} // namespace orderkv::codec
