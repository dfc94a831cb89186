#include "record/errors.hpp"

#include <fmt/core.h>

namespace orderkv::record {

    auto ReadError::to_string() const -> std::string {
        switch (kind_) {
        case ReadErrorKind::None:
            return "OK";
        case ReadErrorKind::Store:
            return fmt::format("store error: {}", status_.to_string());
        case ReadErrorKind::KeyDecode:
            return fmt::format("key decode error: {}", key_status_.to_string());
        case ReadErrorKind::ValueDecode:
            return fmt::format("value decode error: {}", status_.to_string());
        }
        return "unknown read error";
    }

    auto WriteError::to_string() const -> std::string {
        switch (kind_) {
        case WriteErrorKind::None:
            return "OK";
        case WriteErrorKind::Store:
            return fmt::format("store error: {}", status_.to_string());
        case WriteErrorKind::Encode:
            return fmt::format("encode error: {}", status_.to_string());
        }
        return "unknown write error";
    }

} // namespace orderkv::record
