#pragma once

#include "core/common.hpp"
#include "core/status.hpp"
#include "scan/boundary.hpp"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace orderkv::storage {

    struct Entry {
        core::Bytes key;
        core::Bytes value;
    };

    // Forward-only cursor over a key range, ascending by key.
    // While valid(), the current item is either an entry (status().ok()) or a per-item
    // backend error; next() moves past both kinds.
    class StoreCursor {
      public:
        virtual ~StoreCursor() = default;

        [[nodiscard]] virtual auto valid() const -> bool = 0;
        [[nodiscard]] virtual auto status() const -> core::Status = 0;
        [[nodiscard]] virtual auto key() const -> core::BytesView = 0;
        [[nodiscard]] virtual auto value() const -> core::BytesView = 0;
        virtual void next() = 0;
    };

    // Materialized cursor. Owns its entries, so it stays usable after the store changes.
    class VectorCursor final : public StoreCursor {
      public:
        explicit VectorCursor(std::vector<Entry> entries) : entries_(std::move(entries)) {}

        [[nodiscard]] auto valid() const -> bool override {
            return pos_ < entries_.size();
        }
        [[nodiscard]] auto status() const -> core::Status override {
            return core::Status::Ok();
        }
        [[nodiscard]] auto key() const -> core::BytesView override {
            return entries_[pos_].key;
        }
        [[nodiscard]] auto value() const -> core::BytesView override {
            return entries_[pos_].value;
        }
        void next() override {
            ++pos_;
        }

      private:
        std::vector<Entry> entries_;
        size_t pos_ = 0;
    };

    // Minimal ordered byte-keyed container. Keys compare byte-lexicographically and a range
    // never yields the same key twice. Backend errors are passed through opaquely.
    class Store {
      public:
        virtual ~Store() = default;

        // `value` is reset to nullopt when the key is absent
        [[nodiscard]] virtual auto fetch(core::BytesView key, std::optional<core::Bytes> &value)
            -> core::Status = 0;

        // Upsert
        [[nodiscard]] virtual auto insert(core::BytesView key, core::BytesView value)
            -> core::Status = 0;

        // Removing an absent key is not an error
        [[nodiscard]] virtual auto remove(core::BytesView key) -> core::Status = 0;

        // Backends that cannot scan return Status::NotSupported and leave `cursor` empty
        [[nodiscard]] virtual auto range(const scan::ByteRange &range,
                                         std::unique_ptr<StoreCursor> &cursor) -> core::Status = 0;
    };

} // namespace orderkv::storage
