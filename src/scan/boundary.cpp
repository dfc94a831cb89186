#include "scan/boundary.hpp"

#include <fmt/core.h>

namespace orderkv::scan {

    auto prefix_successor(core::BytesView prefix) -> std::optional<core::Bytes> {
        core::Bytes end(prefix);

        while (!end.empty()) {
            auto last = static_cast<uint8_t>(end.back());
            end.pop_back();
            if (last < core::MAX_BYTE) {
                end.push_back(static_cast<char>(last + 1));
                return end;
            }
        }
        return std::nullopt;
    }

    auto prefix_range(core::BytesView prefix) -> ByteRange {
        ByteRange range;
        range.start = ByteBound::included(core::Bytes(prefix));

        if (auto end = prefix_successor(prefix)) {
            range.end = ByteBound::excluded(std::move(*end));
        }
        return range;
    }

    namespace detail {
        auto translate_end(BoundKind kind, core::Bytes encoded, EndInclusion inclusion)
            -> ByteBound {
            if (kind == BoundKind::Excluded) {
                return ByteBound::excluded(std::move(encoded));
            }
            if (inclusion == EndInclusion::Exact) {
                return ByteBound::included(std::move(encoded));
            }
            if (auto end = prefix_successor(encoded)) {
                return ByteBound::excluded(std::move(*end));
            }
            return ByteBound::unbounded();
        }
    } // namespace detail

    auto ByteRange::contains(core::BytesView key) const -> bool {
        switch (start.kind) {
        case BoundKind::Included:
            if (key < core::BytesView(start.key))
                return false;
            break;
        case BoundKind::Excluded:
            if (key <= core::BytesView(start.key))
                return false;
            break;
        case BoundKind::Unbounded:
            break;
        }

        switch (end.kind) {
        case BoundKind::Included:
            return key <= core::BytesView(end.key);
        case BoundKind::Excluded:
            return key < core::BytesView(end.key);
        case BoundKind::Unbounded:
            return true;
        }
        return true;
    }

    static auto bound_to_string(const ByteBound &bound, bool is_start) -> std::string {
        switch (bound.kind) {
        case BoundKind::Included:
            return is_start ? "[" + core::to_hex(bound.key) : core::to_hex(bound.key) + "]";
        case BoundKind::Excluded:
            return is_start ? "(" + core::to_hex(bound.key) : core::to_hex(bound.key) + ")";
        default:
            return is_start ? "(-inf" : "+inf)";
        }
    }

    auto ByteRange::to_string() const -> std::string {
        return fmt::format("{}, {}", bound_to_string(start, true), bound_to_string(end, false));
    }

} // namespace orderkv::scan
