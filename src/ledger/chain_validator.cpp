/**
 * @file chain_validator.cpp
 * @brief Реализация валидатора цепочки
 */

#include "chain_validator.hpp"
#include "../core/constants.hpp"

namespace powledger::ledger {

BlockHeader BlockRecord::header() const {
    return BlockHeader{
        .index = index,
        .timestamp = timestamp,
        .previous_hash = previous_hash,
        .merkle_root = merkle_root,
        .nonce = nonce,
    };
}

ChainValidator::ChainValidator(uint32_t difficulty) noexcept
    : difficulty_(difficulty) {}

BlockDiagnostics ChainValidator::check_block(
    std::span<const BlockRecord> records,
    std::size_t position
) const {
    const auto& current = records[position];

    BlockDiagnostics diag;
    diag.index = current.index;
    diag.hash_valid = current.header().hash() == current.hash;
    diag.pow_valid = meets_difficulty(current.hash, difficulty_);

    if (position == 0) {
        diag.index_valid = current.index == 0;
        diag.prev_hash_valid = current.previous_hash == constants::GENESIS_PREVIOUS_HASH;
    } else {
        const auto& previous = records[position - 1];
        diag.index_valid = current.index == previous.index + 1;
        diag.prev_hash_valid = current.previous_hash == previous.hash;
    }

    return diag;
}

ChainVerdict ChainValidator::validate(std::span<const BlockRecord> records) const {
    ChainVerdict verdict;
    verdict.per_block.reserve(records.size());

    bool cascaded = false;
    for (std::size_t i = 0; i < records.size(); ++i) {
        auto diag = check_block(records, i);
        diag.cascaded = cascaded;
        diag.block_valid = !cascaded && diag.hash_valid && diag.pow_valid &&
                           diag.index_valid && diag.prev_hash_valid;

        if (!diag.block_valid) {
            verdict.overall_valid = false;
            verdict.invalid_indices.push_back(diag.index);
            cascaded = true;
        }
        verdict.per_block.push_back(diag);
    }

    return verdict;
}

BlockRecord to_record(const Block& block) {
    return BlockRecord{
        .index = block.header.index,
        .timestamp = block.header.timestamp,
        .previous_hash = block.header.previous_hash,
        .merkle_root = block.header.merkle_root,
        .nonce = block.header.nonce,
        .hash = block.hash,
    };
}

std::vector<BlockRecord> to_records(std::span<const Block> blocks) {
    std::vector<BlockRecord> records;
    records.reserve(blocks.size());
    for (const auto& block : blocks) {
        records.push_back(to_record(block));
    }
    return records;
}

ChainVerdict validate_chain(std::span<const BlockRecord> records, uint32_t difficulty) {
    return ChainValidator(difficulty).validate(records);
}

} // namespace powledger::ledger
