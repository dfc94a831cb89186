#include "storage/memory_store.hpp"
#include "log/logger.hpp"
#include "storage/write_batch.hpp"

#include <vector>

namespace orderkv::storage {

    auto MemoryStore::fetch(core::BytesView key, std::optional<core::Bytes> &value)
        -> core::Status {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = data_.find(key);
        if (it == data_.end()) {
            value.reset();
        } else {
            value = it->second;
        }
        return core::Status::Ok();
    }

    auto MemoryStore::insert(core::BytesView key, core::BytesView value) -> core::Status {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = data_.find(key);
        if (it != data_.end()) {
            it->second.assign(value);
        } else {
            data_.emplace(core::Bytes(key), core::Bytes(value));
        }
        return core::Status::Ok();
    }

    auto MemoryStore::remove(core::BytesView key) -> core::Status {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = data_.find(key);
        if (it != data_.end()) {
            data_.erase(it);
        }
        return core::Status::Ok();
    }

    auto MemoryStore::range(const scan::ByteRange &range, std::unique_ptr<StoreCursor> &cursor)
        -> core::Status {
        std::vector<Entry> entries;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = data_.begin();
            switch (range.start.kind) {
            case scan::BoundKind::Included:
                it = data_.lower_bound(range.start.key);
                break;
            case scan::BoundKind::Excluded:
                it = data_.upper_bound(range.start.key);
                break;
            case scan::BoundKind::Unbounded:
                break;
            }

            auto last = data_.end();
            switch (range.end.kind) {
            case scan::BoundKind::Included:
                last = data_.upper_bound(range.end.key);
                break;
            case scan::BoundKind::Excluded:
                last = data_.lower_bound(range.end.key);
                break;
            case scan::BoundKind::Unbounded:
                break;
            }

            // An inverted range is empty rather than undefined
            for (; it != last && it != data_.end() && range.contains(it->first); ++it) {
                entries.push_back(Entry{it->first, it->second});
            }
        }

        LOG_TRACE("MemoryStore range {} materialized {} entries", range.to_string(),
                  entries.size());
        cursor = std::make_unique<VectorCursor>(std::move(entries));
        return core::Status::Ok();
    }

    auto MemoryStore::apply(const WriteBatch &batch) -> core::Status {
        size_t puts = 0;
        size_t removes = 0;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            for (const auto &[key, op] : batch.ops()) {
                if (op) {
                    data_.insert_or_assign(key, *op);
                    ++puts;
                } else {
                    data_.erase(key);
                    ++removes;
                }
            }
        }

        LOG_DEBUG("MemoryStore applied batch: {} puts, {} removes", puts, removes);
        return core::Status::Ok();
    }

    auto MemoryStore::size() const -> size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    void MemoryStore::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }

} // namespace orderkv::storage
