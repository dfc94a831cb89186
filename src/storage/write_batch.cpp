#include "storage/write_batch.hpp"
#include "log/logger.hpp"

namespace orderkv::storage {

    auto WriteBatch::fetch(core::BytesView key, std::optional<core::Bytes> &value)
        -> core::Status {
        auto it = ops_.find(key);
        if (it != ops_.end()) {
            value = it->second;
            return core::Status::Ok();
        }
        return base_.fetch(key, value);
    }

    auto WriteBatch::insert(core::BytesView key, core::BytesView value) -> core::Status {
        ops_.insert_or_assign(core::Bytes(key), core::Bytes(value));
        return core::Status::Ok();
    }

    auto WriteBatch::remove(core::BytesView key) -> core::Status {
        ops_.insert_or_assign(core::Bytes(key), std::nullopt);
        return core::Status::Ok();
    }

    auto WriteBatch::range(const scan::ByteRange &range, std::unique_ptr<StoreCursor> &cursor)
        -> core::Status {
        cursor.reset();
        LOG_WARN("Range scan {} refused: write batches do not support scans", range.to_string());
        return core::Status::NotSupported("write batches do not support range scans");
    }

    auto WriteBatch::commit() -> core::Status {
        if (ops_.empty()) {
            return core::Status::Ok();
        }

        auto status = base_.apply(*this);
        if (!status.ok()) {
            LOG_ERROR("Batch commit of {} operations failed: {}", ops_.size(), status.to_string());
            return status;
        }
        ops_.clear();
        return status;
    }

} // namespace orderkv::storage
