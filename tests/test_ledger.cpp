/**
 * @file test_ledger.cpp
 * @brief Тесты леджера: генезис, майнинг блоков, фиксация UTXO
 */

#include <gtest/gtest.h>

#include "ledger/ledger.hpp"
#include "log/event_log.hpp"

#include <stop_token>

namespace powledger::tests {

using namespace ledger;

class LedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LoggingConfig logging;
        logging.level = "debug";
        events = std::make_unique<log::EventLog>(logging);

        auto created = Ledger::create(LedgerConfig{.difficulty = 1, .max_attempts = 0}, events.get());
        ASSERT_TRUE(created.has_value()) << created.error().message;
        ledger.emplace(std::move(*created));
    }

    /// @brief Трата предзаполненного выхода
    static Transaction spend_seed(uint64_t payment) {
        Transaction tx;
        tx.inputs.push_back(TxInput{
            .previous_txid = std::string(constants::SEED_TXID),
            .output_index = 0,
        });
        tx.outputs.push_back(TxOutput{.value = payment, .script = {0x51}});
        tx.outputs.push_back(TxOutput{
            .value = constants::SEED_VALUE - payment - constants::DEFAULT_FEE,
            .script = {0x52},
        });
        tx.fee = constants::DEFAULT_FEE;
        EXPECT_TRUE(assign_txid(tx).has_value());
        return tx;
    }

    std::unique_ptr<log::EventLog> events;
    std::optional<Ledger> ledger;
};

/**
 * @brief Тест: генезис-блок и предзаполненный выход
 */
TEST_F(LedgerTest, Genesis) {
    ASSERT_EQ(ledger->chain().size(), 1u);

    const auto& genesis = ledger->tip();
    EXPECT_EQ(genesis.header.index, 0u);
    EXPECT_EQ(genesis.header.previous_hash, "0");
    EXPECT_TRUE(genesis.transactions.empty());
    EXPECT_EQ(genesis.header.merkle_root, std::string(64, '0'));
    EXPECT_EQ(genesis.hash, genesis.header.hash());
    EXPECT_TRUE(meets_difficulty(genesis.hash, 1));

    EXPECT_TRUE(ledger->utxo().is_spendable(constants::SEED_TXID, 0));
    EXPECT_EQ(ledger->utxo().unspent_value(), constants::SEED_VALUE);

    EXPECT_TRUE(ledger->validate().overall_valid);

    auto recorded = events->events();
    ASSERT_FALSE(recorded.empty());
    EXPECT_EQ(recorded.back().type, log::EventType::GENESIS);
}

/**
 * @brief Тест: майнинг блока тратит входы и регистрирует выходы
 */
TEST_F(LedgerTest, MineBlockCommits) {
    auto tx = spend_seed(30'000'000);
    auto block = ledger->mine_block({tx});
    ASSERT_TRUE(block.has_value()) << block.error().message;

    EXPECT_EQ(block->header.index, 1u);
    EXPECT_EQ(block->header.previous_hash, ledger->chain()[0].hash);
    EXPECT_EQ(block->header.merkle_root, tx.txid);
    EXPECT_EQ(ledger->chain().size(), 2u);

    EXPECT_FALSE(ledger->utxo().is_spendable(constants::SEED_TXID, 0));
    EXPECT_TRUE(ledger->utxo().is_spendable(tx.txid, 0));
    EXPECT_TRUE(ledger->utxo().is_spendable(tx.txid, 1));
    EXPECT_EQ(ledger->utxo().unspent_value(), constants::SEED_VALUE - constants::DEFAULT_FEE);

    EXPECT_TRUE(ledger->validate().overall_valid);
}

/**
 * @brief Тест: двойная трата внутри блока отклоняется без изменения состояния
 */
TEST_F(LedgerTest, IntraBlockConflict) {
    auto first = spend_seed(10'000'000);
    auto second = spend_seed(20'000'000);

    auto block = ledger->mine_block({first, second});
    ASSERT_FALSE(block.has_value());
    EXPECT_EQ(block.error().code, ErrorCode::BlockConflict);

    EXPECT_EQ(ledger->chain().size(), 1u);
    EXPECT_TRUE(ledger->utxo().is_spendable(constants::SEED_TXID, 0));
    EXPECT_EQ(ledger->utxo().entry_count(), 1u);
    EXPECT_EQ(events->events().back().type, log::EventType::BLOCK_REJECTED);
}

/**
 * @brief Тест: трата уже потраченного выхода в следующем блоке
 */
TEST_F(LedgerTest, SpentInputRejected) {
    ASSERT_TRUE(ledger->mine_block({spend_seed(10'000'000)}).has_value());

    auto block = ledger->mine_block({spend_seed(20'000'000)});
    ASSERT_FALSE(block.has_value());
    EXPECT_EQ(block.error().code, ErrorCode::BlockConflict);
    EXPECT_EQ(ledger->chain().size(), 2u);
}

/**
 * @brief Тест: ссылка на несуществующий выход
 */
TEST_F(LedgerTest, MissingInputRejected) {
    auto tx = spend_seed(1);
    tx.inputs[0].previous_txid = std::string(64, 'e');

    auto block = ledger->mine_block({tx});
    ASSERT_FALSE(block.has_value());
    EXPECT_EQ(block.error().code, ErrorCode::BlockConflict);
}

/**
 * @brief Тест: coinbase входы не проверяются по множеству
 */
TEST_F(LedgerTest, CoinbaseOnlyBlock) {
    auto coinbase = make_coinbase({0x51});
    auto block = ledger->mine_block({coinbase});
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block->header.merkle_root, constants::COINBASE_TXID);
    EXPECT_TRUE(ledger->utxo().is_spendable(constants::COINBASE_TXID, 0));
}

/**
 * @brief Тест: полный раунд нагрузки
 */
TEST_F(LedgerTest, MineRound) {
    WorkloadConfig config;
    config.seed = 1;
    WorkloadGenerator generator(config);

    auto result = ledger->mine_round(generator);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->block.transactions.size(), constants::SPENDS_PER_ROUND + 1);
    EXPECT_EQ(result->summaries.size(), result->block.transactions.size());
    EXPECT_TRUE(result->verdict.overall_valid);
    EXPECT_EQ(result->verdict.per_block.size(), 2u);

    for (const auto& tx : result->block.transactions) {
        if (tx.is_coinbase()) {
            continue;
        }
        EXPECT_FALSE(ledger->utxo().is_spendable(tx.inputs[0].previous_txid,
                                                 tx.inputs[0].output_index));
        EXPECT_TRUE(ledger->utxo().is_spendable(tx.txid, 0));
    }

    auto second = ledger->mine_round(generator);
    ASSERT_TRUE(second.has_value()) << second.error().message;
    EXPECT_EQ(ledger->chain().size(), 3u);
    EXPECT_TRUE(ledger->validate().overall_valid);
}

/**
 * @brief Тест: исчерпание лимита попыток
 */
TEST_F(LedgerTest, MiningExhausted) {
    auto created = Ledger::create(LedgerConfig{.difficulty = 16, .max_attempts = 10});
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, ErrorCode::MiningExhausted);
}

/**
 * @brief Тест: отмена майнинга оставляет цепочку без изменений
 */
TEST_F(LedgerTest, MiningCancelled) {
    std::stop_source source;
    source.request_stop();

    auto block = ledger->mine_block({spend_seed(5'000'000)}, source.get_token());
    ASSERT_FALSE(block.has_value());
    EXPECT_EQ(block.error().code, ErrorCode::MiningCancelled);
    EXPECT_EQ(ledger->chain().size(), 1u);
    EXPECT_TRUE(ledger->utxo().is_spendable(constants::SEED_TXID, 0));
}

} // namespace powledger::tests
