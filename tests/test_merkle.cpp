/**
 * @file test_merkle.cpp
 * @brief Тесты вычисления Merkle root
 */

#include <gtest/gtest.h>

#include "ledger/merkle.hpp"
#include "core/hex.hpp"
#include "crypto/sha256.hpp"

#include <cstring>
#include <string>
#include <vector>

namespace powledger::tests {

class MerkleTest : public ::testing::Test {
protected:
    const std::string a = "48437ddb190b006f858cdd881284ad467d68bfc4c74f3e6f621eb5af33be88d8";
    const std::string b = "0e3e2357e806b6cdb1f70b54c3a3a17b6714ee1f0e68bebb44a74b1efd512098";
    const std::string c = "9b0fc92260312ce44e74ef369f5c66bbb85848f2eddd5a7a1cde251e54ccfdd5";

    /// @brief SHA256d(LE(left) || LE(right)) в прямом порядке байт
    static std::string pair_hash(const std::string& left, const std::string& right) {
        auto l = hash_from_display_hex(left).value();
        auto r = hash_from_display_hex(right).value();
        std::array<uint8_t, 64> combined;
        std::memcpy(combined.data(), l.data(), 32);
        std::memcpy(combined.data() + 32, r.data(), 32);
        return to_hex(crypto::sha256d(combined));
    }
};

/**
 * @brief Тест: пустой список даёт 64 нуля
 */
TEST_F(MerkleTest, Empty) {
    auto root = ledger::compute_merkle_root({});
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(*root, std::string(64, '0'));
}

/**
 * @brief Тест: единственный txid возвращается как есть
 */
TEST_F(MerkleTest, Single) {
    auto root = ledger::compute_merkle_root({a});
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(*root, a);
}

/**
 * @brief Тест: два txid
 */
TEST_F(MerkleTest, Pair) {
    auto root = ledger::compute_merkle_root({a, b});
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(*root, pair_hash(a, b));
}

/**
 * @brief Тест: нечётное количество дублирует последний элемент
 */
TEST_F(MerkleTest, OddDuplicatesLast) {
    auto three = ledger::compute_merkle_root({a, b, c});
    auto four = ledger::compute_merkle_root({a, b, c, c});
    ASSERT_TRUE(three && four);
    EXPECT_EQ(*three, *four);
}

/**
 * @brief Тест: порядок листьев важен
 */
TEST_F(MerkleTest, OrderSensitive) {
    auto ab = ledger::compute_merkle_root({a, b});
    auto ba = ledger::compute_merkle_root({b, a});
    ASSERT_TRUE(ab && ba);
    EXPECT_NE(*ab, *ba);
}

/**
 * @brief Тест: некорректный txid
 */
TEST_F(MerkleTest, InvalidIdentifier) {
    auto root = ledger::compute_merkle_root({a, "not-a-txid"});
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ErrorCode::InvalidIdentifier);

    EXPECT_FALSE(ledger::compute_merkle_root({"abc"}).has_value());
}

/**
 * @brief Тест: результат всегда 64 hex символа
 */
TEST_F(MerkleTest, RootLength) {
    std::vector<std::string> ids(7, a);
    auto root = ledger::compute_merkle_root(ids);
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->size(), 64u);
}

} // namespace powledger::tests
