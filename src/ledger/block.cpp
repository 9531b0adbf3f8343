/**
 * @file block.cpp
 * @brief Реализация блока леджера
 */

#include "block.hpp"
#include "merkle.hpp"
#include "../crypto/sha256.hpp"

#include <chrono>
#include <format>

namespace powledger::ledger {

std::string BlockHeader::to_string() const {
    return std::format("{}|{}|{}|{}|{}", index, timestamp, previous_hash, merkle_root, nonce);
}

std::string BlockHeader::hash() const {
    return crypto::sha256_hex(to_string());
}

bool meets_difficulty(std::string_view hash, uint32_t difficulty) noexcept {
    if (hash.size() < difficulty) {
        return false;
    }
    for (uint32_t i = 0; i < difficulty; ++i) {
        if (hash[i] != '0') {
            return false;
        }
    }
    return true;
}

std::string current_timestamp() {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%TZ}", now);
}

Result<Block> make_block(
    uint64_t index,
    std::string previous_hash,
    std::vector<Transaction> transactions
) {
    std::vector<std::string> txids;
    txids.reserve(transactions.size());
    for (const auto& tx : transactions) {
        txids.push_back(tx.txid);
    }

    auto root = compute_merkle_root(txids);
    if (!root) {
        return std::unexpected(root.error());
    }

    Block block;
    block.header.index = index;
    block.header.timestamp = current_timestamp();
    block.header.previous_hash = std::move(previous_hash);
    block.header.merkle_root = std::move(*root);
    block.header.nonce = 0;
    block.transactions = std::move(transactions);
    block.hash = block.header.hash();
    return block;
}

} // namespace powledger::ledger
