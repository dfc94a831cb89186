#include "core/common.hpp"

namespace orderkv::core {

    auto to_hex(BytesView bytes) -> std::string {
        static constexpr char DIGITS[] = "0123456789abcdef";

        std::string out;
        out.reserve(bytes.size() * 2);
        for (char c : bytes) {
            auto b = static_cast<uint8_t>(c);
            out.push_back(DIGITS[b >> 4]);
            out.push_back(DIGITS[b & 0x0F]);
        }
        return out;
    }

} // namespace orderkv::core
