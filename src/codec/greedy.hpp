#pragma once

#include "codec/key_codec.hpp"

#include <compare>
#include <string>
#include <string_view>

namespace orderkv::codec {

    // Encodes its content with no length header and decodes by consuming every remaining
    // byte. Order-preserving, so it is the tool for string prefix scans, but it can only be
    // the sole or last field of a key.
    template <typename T> struct Greedy {
        T value{};

        Greedy() = default;
        Greedy(T v) : value(std::move(v)) {}

        auto operator*() const -> const T & {
            return value;
        }
        auto operator->() const -> const T * {
            return &value;
        }

        friend auto operator==(const Greedy &, const Greedy &) -> bool = default;
        friend auto operator<=>(const Greedy &, const Greedy &) = default;
    };

    template <typename T> struct ConsumesRemainder<Greedy<T>> : std::true_type {};

    template <> struct KeyCodec<Greedy<std::string>> {
        static constexpr bool order_preserving = true;

        static void encode(const Greedy<std::string> &key, core::Bytes &out) {
            out.append(key.value);
        }

        static auto decode(core::BytesView &in, Greedy<std::string> &out) -> DecodeStatus {
            if (auto err = detail::utf8_error(in)) {
                return DecodeStatus::InvalidUtf8(std::move(*err));
            }
            out.value.assign(in);
            in.remove_prefix(in.size());
            return DecodeStatus::Ok();
        }
    };

    template <> struct KeyCodec<Greedy<core::ByteString>> {
        static constexpr bool order_preserving = true;

        static void encode(const Greedy<core::ByteString> &key, core::Bytes &out) {
            out.append(key.value.begin(), key.value.end());
        }

        static auto decode(core::BytesView &in, Greedy<core::ByteString> &out) -> DecodeStatus {
            out.value.assign(in.begin(), in.end());
            in.remove_prefix(in.size());
            return DecodeStatus::Ok();
        }
    };

    // Borrowed text, encode only. Used as the prefix type for Greedy<std::string> keys.
    template <> struct KeyCodec<Greedy<std::string_view>> {
        static constexpr bool order_preserving = true;

        static void encode(const Greedy<std::string_view> &key, core::Bytes &out) {
            out.append(key.value);
        }
    };

} // namespace orderkv::codec
