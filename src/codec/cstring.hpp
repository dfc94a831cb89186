#pragma once

#include "codec/key_codec.hpp"

#include <compare>
#include <fmt/core.h>
#include <optional>
#include <string>
#include <utility>

namespace orderkv::codec {

    // Byte string without interior NUL bytes, keyed as its bytes plus a 0x00 terminator.
    // The terminator sorts below every other byte, so the encoding is order-preserving and,
    // unlike Greedy, a CString may appear anywhere in a tuple key.
    class CString {
      public:
        CString() = default;

        // nullopt when `text` contains a NUL byte
        static auto from(std::string text) -> std::optional<CString> {
            if (text.find('\0') != std::string::npos) {
                return std::nullopt;
            }
            return CString(std::move(text));
        }

        [[nodiscard]] auto str() const -> const std::string & {
            return text_;
        }

        friend auto operator==(const CString &, const CString &) -> bool = default;
        friend auto operator<=>(const CString &, const CString &) = default;

      private:
        friend struct KeyCodec<CString>;

        explicit CString(std::string text) : text_(std::move(text)) {}

        std::string text_;
    };

    template <> struct KeyCodec<CString> {
        static constexpr bool order_preserving = true;

        static void encode(const CString &value, core::Bytes &out) {
            out.append(value.text_);
            out.push_back('\0');
        }

        static auto decode(core::BytesView &in, CString &out) -> DecodeStatus {
            auto nul = in.find('\0');
            if (nul == core::BytesView::npos) {
                return DecodeStatus::MissingNul(
                    fmt::format("no NUL terminator in {} remaining bytes", in.size()));
            }
            out.text_.assign(in.substr(0, nul));
            in.remove_prefix(nul + 1);
            return DecodeStatus::Ok();
        }
    };

} // namespace orderkv::codec
