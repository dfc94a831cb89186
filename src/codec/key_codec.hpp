#pragma once

#include "codec/decode_status.hpp"
#include "core/common.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace orderkv::codec {

    // Per-type key codec. A specialization provides
    //   static constexpr bool order_preserving;
    //   static void encode(const T &value, core::Bytes &out);           // appends
    //   static auto decode(core::BytesView &in, T &out) -> DecodeStatus;  // consumes
    // `decode` leaves the unconsumed remainder in `in`. On failure `in` and `out` are
    // unspecified. Types without a specialization are not keys.
    template <typename T, typename Enable = void> struct KeyCodec;

    // Set for codecs that swallow the rest of the buffer and therefore may only appear as
    // the sole or last field of a key
    template <typename T> struct ConsumesRemainder : std::false_type {};

    template <typename T, typename = void> struct HasKeyCodec : std::false_type {};
    template <typename T>
    struct HasKeyCodec<T, std::void_t<decltype(KeyCodec<T>::encode(std::declval<const T &>(),
                                                                   std::declval<core::Bytes &>()))>>
        : std::true_type {};

    template <typename T, typename = void> struct HasKeyDecoder : std::false_type {};
    template <typename T>
    struct HasKeyDecoder<T,
                         std::void_t<decltype(KeyCodec<T>::decode(std::declval<core::BytesView &>(),
                                                                  std::declval<T &>()))>>
        : std::true_type {};

    template <typename T> constexpr bool is_key_v = HasKeyCodec<T>::value;
    template <typename T> constexpr bool is_decodable_key_v = HasKeyDecoder<T>::value;

    template <typename T> constexpr bool is_order_preserving_v = KeyCodec<T>::order_preserving;

    // Set for types whose encoding is always empty. They cannot be sequence elements: a
    // stored count would decode to that many elements without consuming a byte.
    template <typename T> struct IsZeroWidth : std::false_type {};
    template <typename T> constexpr bool is_zero_width_v = IsZeroWidth<T>::value;

    namespace detail {
        template <typename T>
        constexpr bool is_fixed_int_v = std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                        !std::is_same_v<T, char> && !std::is_same_v<T, wchar_t> &&
                                        !std::is_same_v<T, char8_t> &&
                                        !std::is_same_v<T, char16_t> &&
                                        !std::is_same_v<T, char32_t>;

        template <typename U> void put_be(U value, core::Bytes &out) {
            static_assert(std::is_unsigned_v<U>);
            for (size_t i = sizeof(U); i > 0; --i) {
                out.push_back(static_cast<char>(static_cast<uint8_t>(value >> ((i - 1) * 8))));
            }
        }

        template <typename U> auto get_be(core::BytesView bytes) -> U {
            static_assert(std::is_unsigned_v<U>);
            U value = 0;
            for (size_t i = 0; i < sizeof(U); ++i) {
                value = static_cast<U>((value << 8) | static_cast<uint8_t>(bytes[i]));
            }
            return value;
        }

        // Takes `n` bytes off the front of `in`, or reports how short it was
        inline auto take(core::BytesView &in, size_t n, core::BytesView &taken) -> DecodeStatus {
            if (in.size() < n) {
                return DecodeStatus::TooShort(n, in.size());
            }
            taken = in.substr(0, n);
            in.remove_prefix(n);
            return DecodeStatus::Ok();
        }

        inline void put_length(size_t length, core::Bytes &out) {
            put_be(static_cast<uint64_t>(length), out);
        }

        inline auto take_length(core::BytesView &in, uint64_t &length) -> DecodeStatus {
            core::BytesView header;
            auto status = take(in, core::LENGTH_HEADER_SIZE, header);
            if (!status.ok()) {
                return std::move(status).in_length_header();
            }
            length = get_be<uint64_t>(header);
            return DecodeStatus::Ok();
        }

        // nullopt when `bytes` is well-formed UTF-8, otherwise a description of the first fault
        auto utf8_error(core::BytesView bytes) -> std::optional<std::string>;
    } // namespace detail

    inline auto is_valid_utf8(core::BytesView bytes) -> bool {
        return !detail::utf8_error(bytes).has_value();
    }

    // Unsigned integers: big-endian
    template <typename T>
    struct KeyCodec<T, std::enable_if_t<detail::is_fixed_int_v<T> && std::is_unsigned_v<T>>> {
        static constexpr bool order_preserving = true;

        static void encode(const T &value, core::Bytes &out) {
            detail::put_be(value, out);
        }

        static auto decode(core::BytesView &in, T &out) -> DecodeStatus {
            core::BytesView raw;
            auto status = detail::take(in, sizeof(T), raw);
            if (status.ok()) {
                out = detail::get_be<T>(raw);
            }
            return status;
        }
    };

    // Signed integers: big-endian two's complement with the sign bit flipped, so negative
    // values sort below non-negative ones
    template <typename T>
    struct KeyCodec<T, std::enable_if_t<detail::is_fixed_int_v<T> && std::is_signed_v<T>>> {
        using Unsigned = std::make_unsigned_t<T>;
        static constexpr Unsigned SIGN_BIT = Unsigned(1) << (sizeof(T) * 8 - 1);
        static constexpr bool order_preserving = true;

        static void encode(const T &value, core::Bytes &out) {
            detail::put_be(static_cast<Unsigned>(static_cast<Unsigned>(value) ^ SIGN_BIT), out);
        }

        static auto decode(core::BytesView &in, T &out) -> DecodeStatus {
            core::BytesView raw;
            auto status = detail::take(in, sizeof(T), raw);
            if (status.ok()) {
                out = static_cast<T>(static_cast<Unsigned>(detail::get_be<Unsigned>(raw) ^ SIGN_BIT));
            }
            return status;
        }
    };

    // IEEE-754: big-endian bit pattern. Non-negative values get the sign bit set, negative
    // values have every bit inverted. NaN ordering is unspecified.
    template <typename T> struct KeyCodec<T, std::enable_if_t<std::is_floating_point_v<T>>> {
        static_assert(std::numeric_limits<T>::is_iec559 && (sizeof(T) == 4 || sizeof(T) == 8),
                      "only IEEE-754 binary32/binary64 keys are supported");
        using Bits = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
        static constexpr Bits SIGN_BIT = Bits(1) << (sizeof(T) * 8 - 1);
        static constexpr bool order_preserving = true;

        static void encode(const T &value, core::Bytes &out) {
            auto bits = std::bit_cast<Bits>(value);
            bits = (bits & SIGN_BIT) ? static_cast<Bits>(~bits) : static_cast<Bits>(bits | SIGN_BIT);
            detail::put_be(bits, out);
        }

        static auto decode(core::BytesView &in, T &out) -> DecodeStatus {
            core::BytesView raw;
            auto status = detail::take(in, sizeof(T), raw);
            if (!status.ok()) {
                return status;
            }
            auto bits = detail::get_be<Bits>(raw);
            bits = (bits & SIGN_BIT) ? static_cast<Bits>(bits ^ SIGN_BIT) : static_cast<Bits>(~bits);
            out = std::bit_cast<T>(bits);
            return status;
        }
    };

    // Fixed-size byte arrays: identity
    template <size_t N> struct KeyCodec<std::array<uint8_t, N>> {
        static constexpr bool order_preserving = true;

        static void encode(const std::array<uint8_t, N> &value, core::Bytes &out) {
            out.append(value.begin(), value.end());
        }

        static auto decode(core::BytesView &in, std::array<uint8_t, N> &out) -> DecodeStatus {
            core::BytesView raw;
            auto status = detail::take(in, N, raw);
            if (status.ok()) {
                for (size_t i = 0; i < N; ++i) {
                    out[i] = static_cast<uint8_t>(raw[i]);
                }
            }
            return status;
        }
    };

    // Strings: 8-byte big-endian length header, then the UTF-8 bytes.
    // Not order-preserving: the length compares before the content.
    template <> struct KeyCodec<std::string> {
        static constexpr bool order_preserving = false;

        static void encode(const std::string &value, core::Bytes &out) {
            detail::put_length(value.size(), out);
            out.append(value);
        }

        static auto decode(core::BytesView &in, std::string &out) -> DecodeStatus {
            uint64_t length = 0;
            auto status = detail::take_length(in, length);
            if (!status.ok()) {
                return status;
            }
            if (in.size() < length) {
                return DecodeStatus::TooShort(static_cast<size_t>(length), in.size());
            }
            auto data = in.substr(0, static_cast<size_t>(length));
            if (auto err = detail::utf8_error(data)) {
                return DecodeStatus::InvalidUtf8(std::move(*err));
            }
            out.assign(data);
            in.remove_prefix(static_cast<size_t>(length));
            return status;
        }
    };

    // Borrowed text, encode only. Same bytes as the equal std::string, so a view can be used
    // to look up or prefix-scan std::string keys without a copy.
    template <> struct KeyCodec<std::string_view> {
        static constexpr bool order_preserving = false;

        static void encode(const std::string_view &value, core::Bytes &out) {
            detail::put_length(value.size(), out);
            out.append(value);
        }
    };

    // Byte strings: same layout as std::string without the UTF-8 check
    template <> struct KeyCodec<core::ByteString> {
        static constexpr bool order_preserving = false;

        static void encode(const core::ByteString &value, core::Bytes &out) {
            detail::put_length(value.size(), out);
            out.append(value.begin(), value.end());
        }

        static auto decode(core::BytesView &in, core::ByteString &out) -> DecodeStatus {
            uint64_t length = 0;
            auto status = detail::take_length(in, length);
            if (!status.ok()) {
                return status;
            }
            core::BytesView raw;
            status = detail::take(in, static_cast<size_t>(length), raw);
            if (status.ok()) {
                out.assign(raw.begin(), raw.end());
            }
            return status;
        }
    };

    template <> struct IsZeroWidth<std::array<uint8_t, 0>> : std::true_type {};

    // Sequences: 8-byte big-endian element count, then every element's encoding.
    // Every element consumes at least one byte, so a decode is bounded by the input size.
    template <typename T>
    struct KeyCodec<std::vector<T>,
                    std::enable_if_t<!std::is_same_v<T, uint8_t> && !is_zero_width_v<T>>> {
        static_assert(!ConsumesRemainder<T>::value, "greedy keys cannot be sequence elements");
        static constexpr bool order_preserving = false;

        static void encode(const std::vector<T> &value, core::Bytes &out) {
            detail::put_length(value.size(), out);
            for (const auto &item : value) {
                KeyCodec<T>::encode(item, out);
            }
        }

        static auto decode(core::BytesView &in, std::vector<T> &out) -> DecodeStatus {
            uint64_t count = 0;
            auto status = detail::take_length(in, count);
            if (!status.ok()) {
                return status;
            }

            out.clear();
            // The count is untrusted; never reserve more than the buffer could hold
            out.reserve(static_cast<size_t>(std::min<uint64_t>(count, in.size())));
            for (uint64_t i = 0; i < count; ++i) {
                T item{};
                auto item_status = KeyCodec<T>::decode(in, item);
                if (!item_status.ok()) {
                    return std::move(item_status).in_field(static_cast<size_t>(i));
                }
                out.push_back(std::move(item));
            }
            return status;
        }
    };

    namespace detail {
        template <typename P> struct OwningPointer : std::false_type {};

        template <typename T> struct OwningPointer<std::unique_ptr<T>> : std::true_type {
            using element_type = T;
            static auto make(T &&value) -> std::unique_ptr<T> {
                return std::make_unique<T>(std::move(value));
            }
        };

        template <typename T> struct OwningPointer<std::shared_ptr<T>> : std::true_type {
            using element_type = T;
            static auto make(T &&value) -> std::shared_ptr<T> {
                return std::make_shared<T>(std::move(value));
            }
        };
    } // namespace detail

    // Owning wrappers forward to the pointee. Encoding requires a non-null pointer; see
    // holds_null.
    template <typename P> struct KeyCodec<P, std::enable_if_t<detail::OwningPointer<P>::value>> {
        using Inner = typename detail::OwningPointer<P>::element_type;
        static constexpr bool order_preserving = KeyCodec<Inner>::order_preserving;

        static void encode(const P &value, core::Bytes &out) {
            KeyCodec<Inner>::encode(*value, out);
        }

        static auto decode(core::BytesView &in, P &out) -> DecodeStatus {
            Inner inner{};
            auto status = KeyCodec<Inner>::decode(in, inner);
            if (status.ok()) {
                out = detail::OwningPointer<P>::make(std::move(inner));
            }
            return status;
        }
    };

    template <typename T> struct ConsumesRemainder<std::unique_ptr<T>> : ConsumesRemainder<T> {};
    template <typename T> struct ConsumesRemainder<std::shared_ptr<T>> : ConsumesRemainder<T> {};
    template <typename T> struct IsZeroWidth<std::unique_ptr<T>> : IsZeroWidth<T> {};
    template <typename T> struct IsZeroWidth<std::shared_ptr<T>> : IsZeroWidth<T> {};

    // Null-pointer scan over a key. KeyCodec::encode dereferences owning pointers, so callers
    // holding keys they did not build check here first.
    template <typename T, typename Enable = void> struct NullCheck {
        static auto holds_null(const T &) -> bool {
            return false;
        }
    };

    template <typename P> struct NullCheck<P, std::enable_if_t<detail::OwningPointer<P>::value>> {
        using Inner = typename detail::OwningPointer<P>::element_type;
        static auto holds_null(const P &value) -> bool {
            return !value || NullCheck<Inner>::holds_null(*value);
        }
    };

    template <typename T> struct NullCheck<std::vector<T>> {
        static auto holds_null(const std::vector<T> &value) -> bool {
            return std::any_of(value.begin(), value.end(),
                               [](const T &item) { return NullCheck<T>::holds_null(item); });
        }
    };

    template <typename T> auto holds_null(const T &value) -> bool {
        return NullCheck<T>::holds_null(value);
    }

    template <typename T> auto encode_key(const T &value) -> core::Bytes {
        static_assert(is_key_v<T>, "type has no KeyCodec specialization");
        core::Bytes out;
        KeyCodec<T>::encode(value, out);
        return out;
    }

    // Decodes one T from the front of `bytes`. The unconsumed remainder is stored in `rest`
    // when given.
    template <typename T>
    [[nodiscard]] auto decode_key(core::BytesView bytes, T &out, core::BytesView *rest = nullptr)
        -> DecodeStatus {
        static_assert(is_decodable_key_v<T>, "type has no KeyCodec decoder");
        auto status = KeyCodec<T>::decode(bytes, out);
        if (status.ok() && rest) {
            *rest = bytes;
        }
        return status;
    }

} // namespace orderkv::codec
