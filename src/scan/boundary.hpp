#pragma once

#include "codec/key_codec.hpp"
#include "core/common.hpp"

#include <optional>
#include <string>
#include <utility>

namespace orderkv::scan {

    enum class BoundKind { Included, Excluded, Unbounded };

    struct ByteBound {
        BoundKind kind = BoundKind::Unbounded;
        core::Bytes key;

        static auto included(core::Bytes key) -> ByteBound {
            return ByteBound{BoundKind::Included, std::move(key)};
        }
        static auto excluded(core::Bytes key) -> ByteBound {
            return ByteBound{BoundKind::Excluded, std::move(key)};
        }
        static auto unbounded() -> ByteBound {
            return ByteBound{};
        }

        [[nodiscard]] auto is_unbounded() const -> bool {
            return kind == BoundKind::Unbounded;
        }

        friend auto operator==(const ByteBound &, const ByteBound &) -> bool = default;
    };

    // Byte range handed to a store. Both ends are compared byte-lexicographically.
    struct ByteRange {
        ByteBound start;
        ByteBound end;

        static auto all() -> ByteRange {
            return ByteRange{};
        }

        [[nodiscard]] auto contains(core::BytesView key) const -> bool;
        [[nodiscard]] auto to_string() const -> std::string;

        friend auto operator==(const ByteRange &, const ByteRange &) -> bool = default;
    };

    // How an included end bound on a typed range is translated to bytes.
    //  Exact:  the end is an included byte bound on the encoded value; keys that merely
    //          extend the encoding (nested sub-keys) are left out.
    //  Nested: the end is carried to an exclusive bound, so every key whose encoding starts
    //          with the encoded end value is inside the range.
    enum class EndInclusion { Exact, Nested };

    // Smallest byte string greater than every string starting with `prefix`: the rightmost
    // byte below 0xFF is incremented and everything after it dropped. nullopt when `prefix`
    // is empty or all 0xFF, meaning there is no finite upper bound.
    auto prefix_successor(core::BytesView prefix) -> std::optional<core::Bytes>;

    // [prefix, successor) or [prefix, +inf)
    auto prefix_range(core::BytesView prefix) -> ByteRange;

    // Logical bound over a typed key
    template <typename P> struct Bound {
        BoundKind kind = BoundKind::Unbounded;
        std::optional<P> value;
    };

    template <typename P> struct KeyRange {
        Bound<P> start;
        Bound<P> end;

        static auto all() -> KeyRange {
            return KeyRange{};
        }
        // [from, to]
        static auto closed(P from, P to) -> KeyRange {
            return KeyRange{{BoundKind::Included, std::move(from)}, {BoundKind::Included, std::move(to)}};
        }
        // [from, to)
        static auto half_open(P from, P to) -> KeyRange {
            return KeyRange{{BoundKind::Included, std::move(from)}, {BoundKind::Excluded, std::move(to)}};
        }
        static auto at_least(P from) -> KeyRange {
            return KeyRange{{BoundKind::Included, std::move(from)}, {}};
        }
        static auto greater_than(P from) -> KeyRange {
            return KeyRange{{BoundKind::Excluded, std::move(from)}, {}};
        }
        static auto below(P to) -> KeyRange {
            return KeyRange{{}, {BoundKind::Excluded, std::move(to)}};
        }
        static auto at_most(P to) -> KeyRange {
            return KeyRange{{}, {BoundKind::Included, std::move(to)}};
        }
    };

    namespace detail {
        auto translate_end(BoundKind kind, core::Bytes encoded, EndInclusion inclusion)
            -> ByteBound;
    }

    template <typename P>
    auto encode_range(const KeyRange<P> &range, EndInclusion inclusion = EndInclusion::Nested)
        -> ByteRange {
        ByteRange out;

        if (range.start.kind != BoundKind::Unbounded && range.start.value) {
            out.start = ByteBound{range.start.kind, codec::encode_key(*range.start.value)};
        }
        if (range.end.kind != BoundKind::Unbounded && range.end.value) {
            out.end = detail::translate_end(range.end.kind, codec::encode_key(*range.end.value),
                                            inclusion);
        }
        return out;
    }

} // namespace orderkv::scan
