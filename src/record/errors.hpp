#pragma once

#include "codec/decode_status.hpp"
#include "core/status.hpp"

#include <optional>
#include <string>
#include <utility>

namespace orderkv::record {

    enum class ReadErrorKind { None, Store, KeyDecode, ValueDecode };

    // Failure of fetch or of one scanned item. Store errors are the backend's own status,
    // passed through untouched.
    class ReadError {
      public:
        ReadError() = default;

        static auto Store(core::Status status) -> ReadError {
            ReadError e(ReadErrorKind::Store);
            e.status_ = std::move(status);
            return e;
        }
        static auto KeyDecode(codec::DecodeStatus status) -> ReadError {
            ReadError e(ReadErrorKind::KeyDecode);
            e.key_status_ = std::move(status);
            return e;
        }
        static auto ValueDecode(core::Status status) -> ReadError {
            ReadError e(ReadErrorKind::ValueDecode);
            e.status_ = std::move(status);
            return e;
        }

        [[nodiscard]] auto ok() const -> bool {
            return kind_ == ReadErrorKind::None;
        }
        [[nodiscard]] auto kind() const -> ReadErrorKind {
            return kind_;
        }
        // Store and ValueDecode
        [[nodiscard]] auto status() const -> const core::Status & {
            return status_;
        }
        // KeyDecode
        [[nodiscard]] auto key_status() const -> const codec::DecodeStatus & {
            return key_status_;
        }

        [[nodiscard]] auto to_string() const -> std::string;

      private:
        explicit ReadError(ReadErrorKind kind) : kind_(kind) {}

        ReadErrorKind kind_ = ReadErrorKind::None;
        core::Status status_;
        codec::DecodeStatus key_status_;
    };

    enum class WriteErrorKind { None, Store, Encode };

    class WriteError {
      public:
        WriteError() = default;

        static auto Store(core::Status status) -> WriteError {
            return WriteError(WriteErrorKind::Store, std::move(status));
        }
        static auto Encode(core::Status status) -> WriteError {
            return WriteError(WriteErrorKind::Encode, std::move(status));
        }

        [[nodiscard]] auto ok() const -> bool {
            return kind_ == WriteErrorKind::None;
        }
        [[nodiscard]] auto kind() const -> WriteErrorKind {
            return kind_;
        }
        [[nodiscard]] auto status() const -> const core::Status & {
            return status_;
        }

        [[nodiscard]] auto to_string() const -> std::string;

      private:
        WriteError(WriteErrorKind kind, core::Status status)
            : kind_(kind), status_(std::move(status)) {}

        WriteErrorKind kind_ = WriteErrorKind::None;
        core::Status status_;
    };

    // Outcome of fetch or of one scanned item. For fetch, ok() with no record means absent.
    template <typename R> class ReadResult {
      public:
        static auto found(R record) -> ReadResult {
            ReadResult r;
            r.record_.emplace(std::move(record));
            return r;
        }
        static auto absent() -> ReadResult {
            return ReadResult();
        }
        static auto failed(ReadError error) -> ReadResult {
            ReadResult r;
            r.error_ = std::move(error);
            return r;
        }

        [[nodiscard]] auto ok() const -> bool {
            return error_.ok();
        }
        [[nodiscard]] auto has_record() const -> bool {
            return record_.has_value();
        }
        [[nodiscard]] auto record() const & -> const R & {
            return *record_;
        }
        [[nodiscard]] auto record() && -> R {
            return std::move(*record_);
        }
        [[nodiscard]] auto error() const -> const ReadError & {
            return error_;
        }

      private:
        ReadResult() = default;

        std::optional<R> record_;
        ReadError error_;
    };

} // namespace orderkv::record
