#pragma once

#include "storage/memory_store.hpp"
#include "storage/store.hpp"

#include <map>
#include <optional>

namespace orderkv::storage {

    // Buffers writes against a MemoryStore and applies them atomically on commit().
    // Reads see pending writes first, then the base store. Scans are refused with
    // NotSupported: a partially-buffered view has no consistent ordering guarantee.
    // Not thread-safe; one batch belongs to one writer.
    class WriteBatch final : public Store {
      public:
        // nullopt marks a pending removal
        using PendingOps = std::map<core::Bytes, std::optional<core::Bytes>, std::less<>>;

        explicit WriteBatch(MemoryStore &base) : base_(base) {}

        WriteBatch(const WriteBatch &) = delete;
        WriteBatch &operator=(const WriteBatch &) = delete;

        [[nodiscard]] auto fetch(core::BytesView key, std::optional<core::Bytes> &value)
            -> core::Status override;
        [[nodiscard]] auto insert(core::BytesView key, core::BytesView value)
            -> core::Status override;
        [[nodiscard]] auto remove(core::BytesView key) -> core::Status override;
        [[nodiscard]] auto range(const scan::ByteRange &range, std::unique_ptr<StoreCursor> &cursor)
            -> core::Status override;

        // Applies and clears the pending operations. On failure nothing is applied and the
        // batch keeps its operations.
        [[nodiscard]] auto commit() -> core::Status;
        void discard() {
            ops_.clear();
        }

        [[nodiscard]] auto pending() const -> size_t {
            return ops_.size();
        }
        [[nodiscard]] auto ops() const -> const PendingOps & {
            return ops_;
        }

      private:
        MemoryStore &base_;
        PendingOps ops_;
    };

} // namespace orderkv::storage
