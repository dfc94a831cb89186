#pragma once

#include "codec/key_codec.hpp"

#include <tuple>
#include <utility>

namespace orderkv::codec {

    namespace detail {
        template <typename... Ts> struct GreedyOnlyLast : std::true_type {};

        template <typename T, typename U, typename... Rest>
        struct GreedyOnlyLast<T, U, Rest...>
            : std::bool_constant<!ConsumesRemainder<T>::value &&
                                 GreedyOnlyLast<U, Rest...>::value> {};

        template <size_t I, typename Tuple>
        auto decode_fields(core::BytesView &in, Tuple &out) -> DecodeStatus {
            if constexpr (I == std::tuple_size_v<Tuple>) {
                return DecodeStatus::Ok();
            } else {
                using Field = std::tuple_element_t<I, Tuple>;
                auto status = KeyCodec<Field>::decode(in, std::get<I>(out));
                if (!status.ok()) {
                    return std::move(status).in_field(I);
                }
                return decode_fields<I + 1>(in, out);
            }
        }
    } // namespace detail

    // Tuples: concatenation of the fields in declared order. Order-preserving iff every
    // field is. The empty tuple is the unit key and encodes to nothing.
    template <typename... Ts> struct KeyCodec<std::tuple<Ts...>> {
        static_assert(detail::GreedyOnlyLast<Ts...>::value,
                      "a greedy field may only be the last field of a tuple key");

        static constexpr bool order_preserving = (true && ... && KeyCodec<Ts>::order_preserving);

        static void encode(const std::tuple<Ts...> &value, core::Bytes &out) {
            std::apply([&out](const Ts &...fields) { (KeyCodec<Ts>::encode(fields, out), ...); },
                       value);
        }

        static auto decode(core::BytesView &in, std::tuple<Ts...> &out) -> DecodeStatus {
            return detail::decode_fields<0>(in, out);
        }
    };

    template <typename A, typename B> struct KeyCodec<std::pair<A, B>> {
        static_assert(!ConsumesRemainder<A>::value,
                      "a greedy field may only be the last field of a pair key");

        static constexpr bool order_preserving =
            KeyCodec<A>::order_preserving && KeyCodec<B>::order_preserving;

        static void encode(const std::pair<A, B> &value, core::Bytes &out) {
            KeyCodec<A>::encode(value.first, out);
            KeyCodec<B>::encode(value.second, out);
        }

        static auto decode(core::BytesView &in, std::pair<A, B> &out) -> DecodeStatus {
            auto status = KeyCodec<A>::decode(in, out.first);
            if (!status.ok()) {
                return std::move(status).in_field(0);
            }
            status = KeyCodec<B>::decode(in, out.second);
            if (!status.ok()) {
                return std::move(status).in_field(1);
            }
            return status;
        }
    };

    template <typename... Ts>
    struct ConsumesRemainder<std::tuple<Ts...>>
        : std::bool_constant<(false || ... || ConsumesRemainder<Ts>::value)> {};

    template <typename A, typename B>
    struct ConsumesRemainder<std::pair<A, B>> : ConsumesRemainder<B> {};

    template <typename... Ts>
    struct IsZeroWidth<std::tuple<Ts...>> : std::bool_constant<(true && ... && IsZeroWidth<Ts>::value)> {};

    template <typename A, typename B>
    struct IsZeroWidth<std::pair<A, B>>
        : std::bool_constant<IsZeroWidth<A>::value && IsZeroWidth<B>::value> {};

    template <typename... Ts> struct NullCheck<std::tuple<Ts...>> {
        static auto holds_null(const std::tuple<Ts...> &value) -> bool {
            return std::apply(
                [](const Ts &...fields) { return (false || ... || NullCheck<Ts>::holds_null(fields)); },
                value);
        }
    };

    template <typename A, typename B> struct NullCheck<std::pair<A, B>> {
        static auto holds_null(const std::pair<A, B> &value) -> bool {
            return NullCheck<A>::holds_null(value.first) || NullCheck<B>::holds_null(value.second);
        }
    };

} // namespace orderkv::codec
