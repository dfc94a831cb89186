#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace orderkv::codec {

    enum class DecodeCode { Ok = 0, DataTooShort = 1, InvalidUtf8 = 2, MissingNul = 3 };

    // Fixed-width field, length header or declared length ran past the buffer
    struct DataTooShort {
        size_t expected = 0;
        size_t actual = 0;

        friend auto operator==(const DataTooShort &, const DataTooShort &) -> bool = default;
    };

    // Outcome of decoding one key. Composite decoders tag a failure with the position of
    // the failing field; nesting accumulates into a path, outermost field first.
    class DecodeStatus {
      public:
        DecodeStatus() : code_(DecodeCode::Ok) {}

        static auto Ok() -> DecodeStatus {
            return DecodeStatus();
        }
        static auto TooShort(size_t expected, size_t actual) -> DecodeStatus {
            DecodeStatus s(DecodeCode::DataTooShort, "");
            s.too_short_ = DataTooShort{expected, actual};
            return s;
        }
        static auto InvalidUtf8(std::string msg) -> DecodeStatus {
            return DecodeStatus(DecodeCode::InvalidUtf8, std::move(msg));
        }
        // NUL-terminated field without its terminator
        static auto MissingNul(std::string msg) -> DecodeStatus {
            return DecodeStatus(DecodeCode::MissingNul, std::move(msg));
        }

        [[nodiscard]] auto ok() const -> bool {
            return code_ == DecodeCode::Ok;
        }
        [[nodiscard]] auto code() const -> DecodeCode {
            return code_;
        }
        [[nodiscard]] auto is_too_short() const -> bool {
            return code_ == DecodeCode::DataTooShort;
        }
        // Only meaningful when is_too_short()
        [[nodiscard]] auto too_short() const -> const DataTooShort & {
            return too_short_;
        }
        [[nodiscard]] auto field_path() const -> const std::vector<size_t> & {
            return field_path_;
        }
        [[nodiscard]] auto in_header() const -> bool {
            return in_header_;
        }

        // Tags this failure as coming from field `index` of the enclosing composite
        [[nodiscard]] auto in_field(size_t index) && -> DecodeStatus {
            field_path_.insert(field_path_.begin(), index);
            return std::move(*this);
        }
        // Tags this failure as coming from a sequence's length header
        [[nodiscard]] auto in_length_header() && -> DecodeStatus {
            in_header_ = true;
            return std::move(*this);
        }

        [[nodiscard]] auto to_string() const -> std::string;

        friend auto operator==(const DecodeStatus &a, const DecodeStatus &b) -> bool {
            return a.code_ == b.code_ && a.too_short_ == b.too_short_ &&
                   a.field_path_ == b.field_path_ && a.in_header_ == b.in_header_ &&
                   a.msg_ == b.msg_;
        }

      private:
        DecodeStatus(DecodeCode code, std::string msg) : code_(code), msg_(std::move(msg)) {}

        DecodeCode code_;
        DataTooShort too_short_;
        std::vector<size_t> field_path_;
        bool in_header_ = false;
        std::string msg_;
    };

} // namespace orderkv::codec
