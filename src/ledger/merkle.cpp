/**
 * @file merkle.cpp
 * @brief Реализация Merkle root
 */

#include "merkle.hpp"
#include "../core/byte_order.hpp"
#include "../core/hex.hpp"
#include "../crypto/sha256.hpp"

#include <cstring>
#include <format>

namespace powledger::ledger {

Hash256 merkle_hash(const Hash256& left, const Hash256& right) noexcept {
    std::array<uint8_t, 64> combined;
    std::memcpy(combined.data(), left.data(), 32);
    std::memcpy(combined.data() + 32, right.data(), 32);

    Hash256 result = crypto::sha256d(combined);
    reverse_bytes(result);
    return result;
}

Result<std::string> compute_merkle_root(const std::vector<std::string>& txids) {
    if (txids.empty()) {
        return hash_to_display_hex(Hash256{});
    }

    std::vector<Hash256> level;
    level.reserve(txids.size() + 1);
    for (std::size_t i = 0; i < txids.size(); ++i) {
        auto leaf = hash_from_display_hex(txids[i]);
        if (!leaf) {
            return Err<std::string>(
                ErrorCode::InvalidIdentifier,
                std::format("Merkle: некорректный txid #{} '{}'", i, txids[i])
            );
        }
        level.push_back(*leaf);
    }

    if (level.size() == 1) {
        return txids.front();
    }

    while (level.size() > 1) {
        // Дублируем последний при нечётном количестве
        if (level.size() % 2 != 0) {
            level.push_back(level.back());
        }

        std::vector<Hash256> next;
        next.reserve(level.size() / 2);
        for (std::size_t i = 0; i < level.size(); i += 2) {
            next.push_back(merkle_hash(level[i], level[i + 1]));
        }
        level = std::move(next);
    }

    return hash_to_display_hex(level[0]);
}

} // namespace powledger::ledger
