#include "codec/codec.hpp"
#include "scan/boundary.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace {
    using namespace orderkv;

    // Any decode must either fail cleanly or re-encode to exactly the bytes it consumed
    template <typename T> void check_round_trip(core::BytesView input) {
        T value{};
        core::BytesView rest;
        auto status = codec::decode_key(input, value, &rest);
        if (!status.ok()) {
            (void)status.to_string();
            return;
        }

        auto consumed = input.substr(0, input.size() - rest.size());
        if (codec::encode_key(value) != consumed) {
            __builtin_trap();
        }
    }
} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size > 64 * 1024) {
        return 0;
    }

    const core::Bytes owned(data, data + size);
    core::BytesView input(owned);

    check_round_trip<uint64_t>(input);
    check_round_trip<int32_t>(input);
    check_round_trip<std::string>(input);
    check_round_trip<std::vector<std::string>>(input);
    check_round_trip<std::vector<std::tuple<uint8_t>>>(input);
    check_round_trip<std::tuple<codec::CString, uint16_t, codec::CString>>(input);
    check_round_trip<std::tuple<int16_t, std::string, codec::Greedy<std::string>>>(input);
    check_round_trip<std::tuple<uint8_t, std::vector<int64_t>, codec::Greedy<core::ByteString>>>(
        input);

    auto range = scan::prefix_range(input);
    core::Bytes extended(input);
    extended.push_back(static_cast<char>(core::MAX_BYTE));
    if (!range.contains(input) || !range.contains(extended)) {
        __builtin_trap();
    }
    if (auto successor = scan::prefix_successor(input); successor && range.contains(*successor)) {
        __builtin_trap();
    }

    return 0;
}
