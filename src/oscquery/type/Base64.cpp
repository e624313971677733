#include "Base64.hpp"

#include <algorithm>
#include <cstdint>

namespace OQ {

auto encode_base64(std::span<std::byte const> bytes) -> std::string {
    static constexpr std::string_view kAlphabet{"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

    std::string encoded;
    encoded.reserve(((bytes.size() + 2U) / 3U) * 4U);
    for (std::size_t index = 0; index < bytes.size(); index += 3U) {
        auto const    available = std::min<std::size_t>(3U, bytes.size() - index);
        std::uint32_t group     = 0;
        for (std::size_t i = 0; i < 3U; ++i) {
            group <<= 8U;
            if (i < available)
                group |= static_cast<std::uint32_t>(bytes[index + i]);
        }
        // One input byte yields two symbols, two yield three, three yield four.
        for (std::size_t i = 0; i < 4U; ++i) {
            if (i <= available)
                encoded.push_back(kAlphabet[(group >> (18U - 6U * i)) & 0x3FU]);
            else
                encoded.push_back('=');
        }
    }
    return encoded;
}

} // namespace OQ
