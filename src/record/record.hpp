#pragma once

#include "codec/codec.hpp"
#include "core/common.hpp"
#include "core/status.hpp"
#include "log/logger.hpp"
#include "record/errors.hpp"
#include "scan/boundary.hpp"
#include "storage/store.hpp"

#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace orderkv::record {

    // A record type R maps one typed key plus an opaque payload:
    //
    //   struct User {
    //       using Key = uint64_t;
    //       auto try_encode(Key &key, core::Bytes &value) const -> core::Status;
    //       static auto try_decode(const Key &key, core::BytesView value, User &out)
    //           -> core::Status;
    //   };
    //
    // R and R::Key must be default-constructible. Keys with owning pointers must be non-null
    // for fetch and scans; persist and remove reject a null key with WriteError::Encode. Deriving from Record<R> adds the member
    // spelling (User::fetch(store, 7), user.persist(store)).
    template <typename R, typename = void> struct IsRecord : std::false_type {};
    template <typename R>
    struct IsRecord<
        R, std::void_t<typename R::Key,
                       decltype(std::declval<const R &>().try_encode(
                           std::declval<typename R::Key &>(), std::declval<core::Bytes &>())),
                       decltype(R::try_decode(std::declval<const typename R::Key &>(),
                                              std::declval<core::BytesView>(),
                                              std::declval<R &>()))>>
        : std::bool_constant<codec::is_key_v<typename R::Key> &&
                             codec::is_decodable_key_v<typename R::Key>> {};

    template <typename R> constexpr bool is_record_v = IsRecord<R>::value;

    // Lazily decodes the entries of one store range into records. Each item succeeds or fails
    // on its own; a bad entry never ends the scan. status() reports a failure of the scan as
    // a whole (e.g. NotSupported), which is distinct from an empty result.
    template <typename R> class RecordCursor {
      public:
        RecordCursor(core::Status status, std::unique_ptr<storage::StoreCursor> cursor)
            : status_(std::move(status)), cursor_(std::move(cursor)) {}

        [[nodiscard]] auto status() const -> const core::Status & {
            return status_;
        }

        // nullopt once the range is exhausted or the scan itself failed
        auto next() -> std::optional<ReadResult<R>> {
            if (!status_.ok() || !cursor_ || !cursor_->valid()) {
                return std::nullopt;
            }

            auto result = decode_current();
            cursor_->next();
            return result;
        }

        // Drains the cursor
        auto collect() -> std::vector<ReadResult<R>> {
            std::vector<ReadResult<R>> out;
            while (auto item = next()) {
                out.push_back(std::move(*item));
            }
            return out;
        }

      private:
        auto decode_current() -> ReadResult<R> {
            auto item_status = cursor_->status();
            if (!item_status.ok()) {
                return ReadResult<R>::failed(ReadError::Store(std::move(item_status)));
            }

            typename R::Key key{};
            auto key_status = codec::decode_key(cursor_->key(), key);
            if (!key_status.ok()) {
                LOG_DEBUG("Skipping undecodable key {}: {}", core::to_hex(cursor_->key()),
                          key_status.to_string());
                return ReadResult<R>::failed(ReadError::KeyDecode(std::move(key_status)));
            }

            R record{};
            auto value_status = R::try_decode(key, cursor_->value(), record);
            if (!value_status.ok()) {
                LOG_DEBUG("Value under key {} failed to decode: {}", core::to_hex(cursor_->key()),
                          value_status.to_string());
                return ReadResult<R>::failed(ReadError::ValueDecode(std::move(value_status)));
            }
            return ReadResult<R>::found(std::move(record));
        }

        core::Status status_;
        std::unique_ptr<storage::StoreCursor> cursor_;
    };

    template <typename R>
    [[nodiscard]] auto fetch(storage::Store &store, const typename R::Key &key) -> ReadResult<R> {
        static_assert(is_record_v<R>, "R does not satisfy the record interface");

        std::optional<core::Bytes> value;
        auto status = store.fetch(codec::encode_key(key), value);
        if (!status.ok()) {
            return ReadResult<R>::failed(ReadError::Store(std::move(status)));
        }
        if (!value) {
            return ReadResult<R>::absent();
        }

        R record{};
        auto value_status = R::try_decode(key, *value, record);
        if (!value_status.ok()) {
            return ReadResult<R>::failed(ReadError::ValueDecode(std::move(value_status)));
        }
        return ReadResult<R>::found(std::move(record));
    }

    namespace detail {
        template <typename R>
        auto scan_bytes(storage::Store &store, const scan::ByteRange &range) -> RecordCursor<R> {
            static_assert(is_record_v<R>, "R does not satisfy the record interface");

            LOG_TRACE("Scanning byte range {}", range.to_string());
            std::unique_ptr<storage::StoreCursor> cursor;
            auto status = store.range(range, cursor);
            if (!status.ok()) {
                return RecordCursor<R>(std::move(status), nullptr);
            }
            return RecordCursor<R>(core::Status::Ok(), std::move(cursor));
        }
    } // namespace detail

    // Every record in the store, ascending by encoded key
    template <typename R> [[nodiscard]] auto scan(storage::Store &store) -> RecordCursor<R> {
        return detail::scan_bytes<R>(store, scan::ByteRange::all());
    }

    template <typename R, typename P>
    [[nodiscard]] auto scan_range(storage::Store &store, const scan::KeyRange<P> &range,
                                  scan::EndInclusion inclusion = scan::EndInclusion::Nested)
        -> RecordCursor<R> {
        static_assert(codec::is_prefix_key_v<P, typename R::Key>,
                      "P is not a declared prefix of the record key");
        return detail::scan_bytes<R>(store, scan::encode_range(range, inclusion));
    }

    template <typename R, typename P>
    [[nodiscard]] auto scan_prefix(storage::Store &store, const P &prefix) -> RecordCursor<R> {
        static_assert(codec::is_prefix_key_v<P, typename R::Key>,
                      "P is not a declared prefix of the record key");
        return detail::scan_bytes<R>(store, scan::prefix_range(codec::encode_key(prefix)));
    }

    // Upsert. Nothing reaches the store if the record fails to encode.
    template <typename R>
    [[nodiscard]] auto persist(const R &record, storage::Store &store) -> WriteError {
        static_assert(is_record_v<R>, "R does not satisfy the record interface");

        typename R::Key key{};
        core::Bytes value;
        auto encode_status = record.try_encode(key, value);
        if (!encode_status.ok()) {
            LOG_WARN("Record rejected before write: {}", encode_status.to_string());
            return WriteError::Encode(std::move(encode_status));
        }
        if (codec::holds_null(key)) {
            LOG_WARN("Record rejected before write: key holds a null pointer");
            return WriteError::Encode(core::Status::InvalidArgument("key holds a null pointer"));
        }

        auto status = store.insert(codec::encode_key(key), value);
        if (!status.ok()) {
            return WriteError::Store(std::move(status));
        }
        return WriteError();
    }

    template <typename R>
    [[nodiscard]] auto remove(storage::Store &store, const typename R::Key &key) -> WriteError {
        if (codec::holds_null(key)) {
            return WriteError::Encode(core::Status::InvalidArgument("key holds a null pointer"));
        }
        auto status = store.remove(codec::encode_key(key));
        if (!status.ok()) {
            return WriteError::Store(std::move(status));
        }
        return WriteError();
    }

    // CRTP mixin giving a record type the member spelling of the operations above
    template <typename Derived> class Record {
      public:
        template <typename K> static auto fetch(storage::Store &store, const K &key) {
            return record::fetch<Derived>(store, key);
        }
        static auto scan(storage::Store &store) -> RecordCursor<Derived> {
            return record::scan<Derived>(store);
        }
        template <typename P>
        static auto scan_range(storage::Store &store, const scan::KeyRange<P> &range,
                               scan::EndInclusion inclusion = scan::EndInclusion::Nested)
            -> RecordCursor<Derived> {
            return record::scan_range<Derived>(store, range, inclusion);
        }
        template <typename P>
        static auto scan_prefix(storage::Store &store, const P &prefix) -> RecordCursor<Derived> {
            return record::scan_prefix<Derived>(store, prefix);
        }
        template <typename K> static auto remove(storage::Store &store, const K &key) {
            return record::remove<Derived>(store, key);
        }

        auto persist(storage::Store &store) const -> WriteError {
            return record::persist(static_cast<const Derived &>(*this), store);
        }
    };

} // namespace orderkv::record
