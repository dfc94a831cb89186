#pragma once

#include "codec/greedy.hpp"
#include "codec/tuple.hpp"

#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace orderkv::codec {

    namespace detail {
        template <typename Tuple, typename Seq> struct TupleHead;
        template <typename Tuple, size_t... I>
        struct TupleHead<Tuple, std::index_sequence<I...>> {
            using type = std::tuple<std::tuple_element_t<I, Tuple>...>;
        };
        template <size_t N, typename Tuple>
        using tuple_head_t = typename TupleHead<Tuple, std::make_index_sequence<N>>::type;

        template <bool InRange, typename P, typename K> struct LeadingSubtuple : std::false_type {};
        template <typename... Ps, typename... Ks>
        struct LeadingSubtuple<true, std::tuple<Ps...>, std::tuple<Ks...>>
            : std::is_same<std::tuple<Ps...>, tuple_head_t<sizeof...(Ps), std::tuple<Ks...>>> {};

        template <typename P, typename K> struct IsLeadingSubtuple : std::false_type {};
        template <typename... Ps, typename... Ks>
        struct IsLeadingSubtuple<std::tuple<Ps...>, std::tuple<Ks...>>
            : LeadingSubtuple<(sizeof...(Ps) > 0 && sizeof...(Ps) < sizeof...(Ks)),
                              std::tuple<Ps...>, std::tuple<Ks...>> {};

        template <typename P, typename K> struct IsLeadingField : std::false_type {};
        template <typename P, typename K0, typename... Ks>
        struct IsLeadingField<P, std::tuple<K0, Ks...>> : std::is_same<P, K0> {};
    } // namespace detail

    // Declares that every encoding of a P is a byte prefix of some valid K encoding.
    // Specialize to declare further pairs; nothing is inferred from the byte layout.
    template <typename P, typename K> struct DeclaredPrefix : std::false_type {};

    // (A, B, .., N): every non-empty strict leading sub-tuple, and the bare first field
    template <typename P, typename... Ks>
    struct DeclaredPrefix<P, std::tuple<Ks...>>
        : std::bool_constant<detail::IsLeadingSubtuple<P, std::tuple<Ks...>>::value ||
                             detail::IsLeadingField<P, std::tuple<Ks...>>::value> {};

    template <>
    struct DeclaredPrefix<Greedy<std::string_view>, Greedy<std::string>> : std::true_type {};

    template <> struct DeclaredPrefix<std::string_view, std::string> : std::true_type {};

    // Every key is a prefix of itself
    template <typename P, typename K>
    struct IsPrefixKey : std::disjunction<std::is_same<P, K>, DeclaredPrefix<P, K>> {};

    template <typename P, typename K> constexpr bool is_prefix_key_v = IsPrefixKey<P, K>::value;

} // namespace orderkv::codec
