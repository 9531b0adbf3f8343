/**
 * @file raw_block.cpp
 * @brief Нормализация импортированных записей
 */

#include "raw_block.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace powledger::io {

ledger::Block RawBlockRecord::normalize() const {
    ledger::Block block;
    block.header.index = index.value_or(0);
    block.header.timestamp = timestamp.value_or("");
    block.header.previous_hash = previous_hash.value_or("");
    block.header.merkle_root = merkle_root.value_or("");
    block.header.nonce = nonce.value_or(0);
    block.hash = hash.value_or("");
    if (transactions) {
        block.transactions = *transactions;
    }
    return block;
}

std::optional<uint64_t> parse_unsigned(std::string_view text) noexcept {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    if (text.empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint64_t> unsigned_from_signed(int64_t value) noexcept {
    if (value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

std::optional<uint64_t> unsigned_from_double(double value) noexcept {
    // 2^64: первое значение, не представимое в uint64_t
    constexpr double limit = 18446744073709551616.0;
    if (!std::isfinite(value) || value < 0 || value >= limit) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

} // namespace powledger::io
