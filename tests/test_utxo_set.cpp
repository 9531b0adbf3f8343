/**
 * @file test_utxo_set.cpp
 * @brief Тесты множества непотраченных выходов
 */

#include <gtest/gtest.h>

#include "ledger/utxo_set.hpp"

#include <string>

namespace powledger::tests {

using namespace ledger;

class UtxoSetTest : public ::testing::Test {
protected:
    void SetUp() override {
        utxo.register_outputs("aa", {TxOutput{.value = 100, .script = {0x01}},
                                     TxOutput{.value = 200, .script = {0x02}}});
        utxo.register_outputs("bb", {TxOutput{.value = 300, .script = {0x03}}});
    }

    UtxoSet utxo;
};

/**
 * @brief Тест: регистрация создаёт записи с индексами по позиции
 */
TEST_F(UtxoSetTest, Register) {
    EXPECT_EQ(utxo.entry_count(), 3u);
    EXPECT_EQ(utxo.unspent_count(), 3u);
    EXPECT_EQ(utxo.unspent_value(), 600u);

    auto entry = utxo.find("aa", 1);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->owning_txid, "aa");
    EXPECT_EQ(entry->output_index, 1u);
    EXPECT_EQ(entry->value, 200u);
    EXPECT_EQ(entry->script, Bytes{0x02});
    EXPECT_FALSE(entry->spent);
}

/**
 * @brief Тест: list_available в порядке регистрации
 */
TEST_F(UtxoSetTest, ListOrder) {
    auto list = utxo.list_available();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].owning_txid, "aa");
    EXPECT_EQ(list[0].output_index, 0u);
    EXPECT_EQ(list[1].owning_txid, "aa");
    EXPECT_EQ(list[1].output_index, 1u);
    EXPECT_EQ(list[2].owning_txid, "bb");
}

/**
 * @brief Тест: трата помечает запись, повторная трата отклоняется
 */
TEST_F(UtxoSetTest, SpendOnce) {
    EXPECT_TRUE(utxo.spend("aa", 0));
    EXPECT_FALSE(utxo.is_spendable("aa", 0));
    EXPECT_FALSE(utxo.spend("aa", 0));

    auto entry = utxo.find("aa", 0);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->spent);

    EXPECT_EQ(utxo.entry_count(), 3u);
    EXPECT_EQ(utxo.unspent_count(), 2u);
    EXPECT_EQ(utxo.unspent_value(), 500u);

    for (const auto& item : utxo.list_available()) {
        EXPECT_FALSE(item.owning_txid == "aa" && item.output_index == 0);
    }
}

/**
 * @brief Тест: трата отсутствующего выхода
 */
TEST_F(UtxoSetTest, SpendMissing) {
    EXPECT_FALSE(utxo.spend("cc", 0));
    EXPECT_FALSE(utxo.spend("bb", 1));
    EXPECT_FALSE(utxo.is_spendable("cc", 0));
    EXPECT_FALSE(utxo.find("cc", 0).has_value());
    EXPECT_EQ(utxo.unspent_count(), 3u);
}

/**
 * @brief Тест: повторная регистрация заменяет выходы, сохраняя позицию
 */
TEST_F(UtxoSetTest, Reregister) {
    utxo.spend("aa", 0);
    utxo.register_outputs("aa", {TxOutput{.value = 7, .script = {}}});

    EXPECT_TRUE(utxo.is_spendable("aa", 0));
    EXPECT_FALSE(utxo.find("aa", 1).has_value());
    EXPECT_EQ(utxo.entry_count(), 2u);

    auto list = utxo.list_available();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].owning_txid, "aa");
    EXPECT_EQ(list[0].value, 7u);
    EXPECT_EQ(list[1].owning_txid, "bb");
}

/**
 * @brief Тест: снимок не зависит от последующих изменений
 */
TEST_F(UtxoSetTest, SnapshotIsCopy) {
    auto snapshot = utxo.list_available();
    utxo.spend("bb", 0);
    EXPECT_EQ(snapshot.size(), 3u);
    EXPECT_FALSE(snapshot[2].spent);
}

} // namespace powledger::tests
