#pragma once

#include "storage/store.hpp"

#include <map>
#include <mutex>

namespace orderkv::storage {

    class WriteBatch;

    // Reference backend: std::map behind a single mutex.
    // range() copies the matching entries while holding the lock and hands out a cursor over
    // that copy, so iteration never holds the lock and sees a snapshot taken at call time.
    class MemoryStore final : public Store {
      public:
        MemoryStore() = default;

        MemoryStore(const MemoryStore &) = delete;
        MemoryStore &operator=(const MemoryStore &) = delete;

        [[nodiscard]] auto fetch(core::BytesView key, std::optional<core::Bytes> &value)
            -> core::Status override;
        [[nodiscard]] auto insert(core::BytesView key, core::BytesView value)
            -> core::Status override;
        [[nodiscard]] auto remove(core::BytesView key) -> core::Status override;
        [[nodiscard]] auto range(const scan::ByteRange &range, std::unique_ptr<StoreCursor> &cursor)
            -> core::Status override;

        // Applies every pending operation of `batch` under one lock acquisition
        [[nodiscard]] auto apply(const WriteBatch &batch) -> core::Status;

        [[nodiscard]] auto size() const -> size_t;
        void clear();

      private:
        mutable std::mutex mutex_;
        std::map<core::Bytes, core::Bytes, std::less<>> data_;
    };

} // namespace orderkv::storage
