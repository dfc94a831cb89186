#include "codec/key_codec.hpp"

#include <fmt/core.h>

namespace orderkv::codec::detail {

    // Rejects overlong forms, surrogates and code points above U+10FFFF
    auto utf8_error(core::BytesView bytes) -> std::optional<std::string> {
        size_t i = 0;
        while (i < bytes.size()) {
            auto lead = static_cast<uint8_t>(bytes[i]);
            if (lead < 0x80) {
                ++i;
                continue;
            }

            size_t extra = 0;
            uint32_t cp = 0;
            uint32_t min_cp = 0;
            if ((lead & 0xE0) == 0xC0) {
                extra = 1;
                cp = lead & 0x1F;
                min_cp = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                extra = 2;
                cp = lead & 0x0F;
                min_cp = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                extra = 3;
                cp = lead & 0x07;
                min_cp = 0x10000;
            } else {
                return fmt::format("invalid lead byte 0x{:02x} at offset {}", lead, i);
            }

            if (extra > bytes.size() - i - 1) {
                return fmt::format("truncated sequence at offset {}", i);
            }
            for (size_t k = 1; k <= extra; ++k) {
                auto cont = static_cast<uint8_t>(bytes[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    return fmt::format("invalid continuation byte 0x{:02x} at offset {}", cont,
                                       i + k);
                }
                cp = (cp << 6) | (cont & 0x3F);
            }

            if (cp < min_cp) {
                return fmt::format("overlong encoding at offset {}", i);
            }
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return fmt::format("invalid code point U+{:X} at offset {}", cp, i);
            }
            i += extra + 1;
        }
        return std::nullopt;
    }

} // namespace orderkv::codec::detail
