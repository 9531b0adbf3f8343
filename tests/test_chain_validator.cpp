/**
 * @file test_chain_validator.cpp
 * @brief Тесты валидатора цепочки
 *
 * Цепочка из трёх блоков майнится с малой сложностью, затем отдельные
 * поля записей портятся и проверяется каскадная инвалидация.
 */

#include <gtest/gtest.h>

#include "ledger/chain_validator.hpp"
#include "ledger/miner.hpp"

#include <vector>

namespace powledger::tests {

using namespace ledger;

class ChainValidatorTest : public ::testing::Test {
protected:
    static constexpr uint32_t DIFFICULTY = 1;

    void SetUp() override {
        std::string prev = "0";
        for (uint64_t i = 0; i < 3; ++i) {
            BlockRecord record;
            record.index = i;
            record.timestamp = "2024-01-01T00:00:0" + std::to_string(i) + ".000Z";
            record.previous_hash = prev;
            record.merkle_root = std::string(64, '0');

            auto result = search(record.header(), DIFFICULTY);
            ASSERT_TRUE(result.found());
            record.nonce = result.nonce;
            record.hash = result.hash;

            prev = record.hash;
            records.push_back(record);
        }
    }

    /// @brief Пересчитать nonce и хеш записи после изменения полей
    static void remine(BlockRecord& record) {
        auto result = search(record.header(), DIFFICULTY);
        record.nonce = result.nonce;
        record.hash = result.hash;
    }

    std::vector<BlockRecord> records;
};

/**
 * @brief Тест: корректная цепочка
 */
TEST_F(ChainValidatorTest, ValidChain) {
    auto verdict = validate_chain(records, DIFFICULTY);

    EXPECT_TRUE(verdict.overall_valid);
    EXPECT_TRUE(verdict.invalid_indices.empty());
    ASSERT_EQ(verdict.per_block.size(), 3u);
    for (const auto& diag : verdict.per_block) {
        EXPECT_TRUE(diag.block_valid);
        EXPECT_TRUE(diag.hash_valid);
        EXPECT_TRUE(diag.pow_valid);
        EXPECT_TRUE(diag.index_valid);
        EXPECT_TRUE(diag.prev_hash_valid);
        EXPECT_FALSE(diag.cascaded);
    }
}

/**
 * @brief Тест: пустая цепочка валидна
 */
TEST_F(ChainValidatorTest, EmptyChain) {
    auto verdict = validate_chain({}, DIFFICULTY);
    EXPECT_TRUE(verdict.overall_valid);
    EXPECT_TRUE(verdict.per_block.empty());
}

/**
 * @brief Тест: подмена nonce в среднем блоке инвалидирует его и все последующие
 */
TEST_F(ChainValidatorTest, NonceTamperCascades) {
    records[1].nonce += 1;

    auto verdict = validate_chain(records, DIFFICULTY);

    EXPECT_FALSE(verdict.overall_valid);
    EXPECT_EQ(verdict.invalid_indices, (std::vector<uint64_t>{1, 2}));

    EXPECT_TRUE(verdict.per_block[0].block_valid);

    EXPECT_FALSE(verdict.per_block[1].hash_valid);
    EXPECT_FALSE(verdict.per_block[1].block_valid);
    EXPECT_FALSE(verdict.per_block[1].cascaded);

    // Блок 2 сам по себе корректен, но следует за невалидным
    EXPECT_TRUE(verdict.per_block[2].hash_valid);
    EXPECT_TRUE(verdict.per_block[2].prev_hash_valid);
    EXPECT_TRUE(verdict.per_block[2].cascaded);
    EXPECT_FALSE(verdict.per_block[2].block_valid);
}

/**
 * @brief Тест: перемайненный блок с другим содержимым рвёт связь со следующим
 */
TEST_F(ChainValidatorTest, RemineBreaksLink) {
    records[1].merkle_root = std::string(64, 'f');
    remine(records[1]);

    auto verdict = validate_chain(records, DIFFICULTY);

    EXPECT_TRUE(verdict.per_block[1].block_valid);
    EXPECT_FALSE(verdict.per_block[2].prev_hash_valid);
    EXPECT_EQ(verdict.invalid_indices, (std::vector<uint64_t>{2}));
}

/**
 * @brief Тест: нарушение нумерации
 */
TEST_F(ChainValidatorTest, IndexGap) {
    records[2].index = 5;
    remine(records[2]);

    auto verdict = validate_chain(records, DIFFICULTY);
    EXPECT_FALSE(verdict.per_block[2].index_valid);
    EXPECT_TRUE(verdict.per_block[2].hash_valid);
    EXPECT_EQ(verdict.invalid_indices, (std::vector<uint64_t>{5}));
}

/**
 * @brief Тест: первый блок должен иметь индекс 0 и previousHash "0"
 */
TEST_F(ChainValidatorTest, GenesisRules) {
    records[0].previous_hash = std::string(64, '0');
    remine(records[0]);

    auto verdict = validate_chain(records, DIFFICULTY);
    EXPECT_FALSE(verdict.per_block[0].prev_hash_valid);
    EXPECT_EQ(verdict.invalid_indices, (std::vector<uint64_t>{0, 1, 2}));
}

/**
 * @brief Тест: более высокая сложность отклоняет слабый PoW
 */
TEST_F(ChainValidatorTest, DifficultyMismatch) {
    ChainValidator strict(16);
    auto verdict = strict.validate(records);

    EXPECT_FALSE(verdict.overall_valid);
    EXPECT_FALSE(verdict.per_block[0].pow_valid);
    EXPECT_TRUE(verdict.per_block[0].hash_valid);
    EXPECT_EQ(verdict.invalid_indices.size(), 3u);
}

/**
 * @brief Тест: преобразование блока в запись
 */
TEST_F(ChainValidatorTest, ToRecord) {
    auto block = make_block(0, "0", {});
    ASSERT_TRUE(block.has_value());
    block->header.nonce = 9;
    block->hash = block->header.hash();

    auto record = to_record(*block);
    EXPECT_EQ(record.index, 0u);
    EXPECT_EQ(record.nonce, 9u);
    EXPECT_EQ(record.hash, block->hash);
    EXPECT_EQ(record.header(), block->header);
}

} // namespace powledger::tests
