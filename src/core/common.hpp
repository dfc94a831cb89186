#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace orderkv::core {

    // Raw key/value bytes. std::string compares as unsigned char, which is exactly the
    // byte-lexicographic order every store has to honour.
    using Bytes = std::string;
    using BytesView = std::string_view;

    // Width of the big-endian length header for variable-length fields. Fixed at 8 bytes,
    // the native word of every 64-bit target, so stored keys read the same on 32-bit hosts.
    constexpr size_t LENGTH_HEADER_SIZE = sizeof(uint64_t);

    constexpr uint8_t MAX_BYTE = 0xFF;

    using ByteString = std::vector<uint8_t>;

    // Lowercase hex rendering, used for diagnostics only
    auto to_hex(BytesView bytes) -> std::string;

} // namespace orderkv::core
