/**
 * @file hex.cpp
 * @brief Реализация hex преобразований
 */

#include "hex.hpp"
#include "byte_order.hpp"
#include "constants.hpp"

#include <algorithm>

namespace powledger {

namespace {

constexpr std::string_view HEX_DIGITS = "0123456789abcdef";

/**
 * @brief Преобразовать hex символ в число
 *
 * @return -1 для символа вне [0-9a-fA-F]
 */
[[nodiscard]] constexpr int hex_char_to_int(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(ByteSpan data) {
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        result.push_back(HEX_DIGITS[byte >> 4]);
        result.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return result;
}

std::optional<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    Bytes result;
    result.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_char_to_int(hex[i]);
        int low = hex_char_to_int(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return result;
}

std::optional<Hash256> hash_from_display_hex(std::string_view hex) {
    if (hex.size() != constants::HASH_HEX_SIZE) {
        return std::nullopt;
    }

    auto bytes = from_hex(hex);
    if (!bytes) {
        return std::nullopt;
    }

    Hash256 result;
    std::copy(bytes->begin(), bytes->end(), result.begin());
    reverse_bytes(result);
    return result;
}

std::string hash_to_display_hex(const Hash256& hash) {
    Hash256 reversed = hash;
    reverse_bytes(reversed);
    return to_hex(reversed);
}

} // namespace powledger
