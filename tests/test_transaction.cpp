/**
 * @file test_transaction.cpp
 * @brief Тесты кодека транзакций
 */

#include <gtest/gtest.h>

#include "ledger/transaction.hpp"
#include "core/hex.hpp"
#include "crypto/sha256.hpp"

#include <string>

namespace powledger::tests {

using namespace ledger;

/**
 * @brief Класс тестов кодека транзакций
 */
class TransactionTest : public ::testing::Test {
protected:
    static constexpr std::string_view PREV_TXID =
        "48437ddb190b006f858cdd881284ad467d68bfc4c74f3e6f621eb5af33be88d8";

    static Transaction make_sample() {
        Transaction tx;
        tx.inputs.push_back(TxInput{
            .previous_txid = std::string(PREV_TXID),
            .output_index = 1,
            .sequence = constants::DEFAULT_SEQUENCE,
        });

        std::array<uint8_t, 20> pkh{};
        pkh.fill(0x11);
        tx.outputs.push_back(TxOutput{.value = 40'000, .script = make_p2pkh_script(pkh)});
        tx.outputs.push_back(TxOutput{.value = 50'000, .script = {0x51}});
        tx.note = "sample";
        tx.fee = 10'000;
        return tx;
    }
};

/**
 * @brief Тест: раскладка байт канонического кодирования
 */
TEST_F(TransactionTest, EncodingLayout) {
    auto tx = make_sample();
    auto encoded = encode_transaction(tx);
    ASSERT_TRUE(encoded.has_value()) << encoded.error().message;

    // version + count + вход(32+4+1+4) + count + выходы(8+1+25, 8+1+1) + locktime
    EXPECT_EQ(encoded->size(), 4u + 1u + 41u + 1u + 34u + 10u + 4u);

    const Bytes& b = *encoded;
    // version = 1 LE
    EXPECT_EQ(b[0], 0x01);
    EXPECT_EQ(b[1], 0x00);
    EXPECT_EQ(b[4], 0x01);  // один вход

    // prev txid в обратном порядке байт: последний байт display hex первым
    EXPECT_EQ(b[5], 0xd8);
    EXPECT_EQ(b[36], 0x48);

    // output_index = 1 LE
    EXPECT_EQ(b[37], 0x01);
    EXPECT_EQ(b[41], 0x00);  // пустой scriptSig

    // sequence = 0xFFFFFFFF
    EXPECT_EQ(b[42], 0xff);
    EXPECT_EQ(b[45], 0xff);

    EXPECT_EQ(b[46], 0x02);  // два выхода

    // value = 40000 = 0x9C40 LE
    EXPECT_EQ(b[47], 0x40);
    EXPECT_EQ(b[48], 0x9c);
    EXPECT_EQ(b[55], 25u);   // длина P2PKH
    EXPECT_EQ(b[56], 0x76);  // OP_DUP

    // locktime = 0
    EXPECT_EQ(b[b.size() - 1], 0x00);
}

/**
 * @brief Тест: txid = reverse(SHA256d(encoding)) в hex
 */
TEST_F(TransactionTest, TxidIsReversedDoubleSha) {
    auto tx = make_sample();
    auto encoded = encode_transaction(tx);
    ASSERT_TRUE(encoded.has_value());

    auto txid = compute_txid(tx);
    ASSERT_TRUE(txid.has_value());
    EXPECT_EQ(*txid, hash_to_display_hex(crypto::sha256d(*encoded)));
    EXPECT_EQ(txid->size(), constants::HASH_HEX_SIZE);
}

/**
 * @brief Тест: txid зависит только от закодированных полей
 */
TEST_F(TransactionTest, TxidDeterministic) {
    auto a = make_sample();
    auto b = make_sample();
    b.note = "другое описание";
    b.fee.reset();

    auto id_a = compute_txid(a);
    auto id_b = compute_txid(b);
    ASSERT_TRUE(id_a && id_b);
    EXPECT_EQ(*id_a, *id_b);

    b.outputs[0].value += 1;
    auto id_changed = compute_txid(b);
    ASSERT_TRUE(id_changed);
    EXPECT_NE(*id_a, *id_changed);
}

/**
 * @brief Тест: assign_txid записывает идентификатор
 */
TEST_F(TransactionTest, AssignTxid) {
    auto tx = make_sample();
    ASSERT_TRUE(assign_txid(tx).has_value());
    EXPECT_EQ(tx.txid, compute_txid(tx).value());
}

/**
 * @brief Тест: decode восстанавливает закодированные поля
 */
TEST_F(TransactionTest, DecodeInverse) {
    auto tx = make_sample();
    auto encoded = encode_transaction(tx);
    ASSERT_TRUE(encoded.has_value());

    auto decoded = decode_transaction(*encoded);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;

    EXPECT_EQ(decoded->version, tx.version);
    EXPECT_EQ(decoded->inputs, tx.inputs);
    EXPECT_EQ(decoded->outputs, tx.outputs);
    EXPECT_EQ(decoded->locktime, tx.locktime);
    EXPECT_TRUE(decoded->txid.empty());
    EXPECT_FALSE(decoded->fee.has_value());
}

/**
 * @brief Тест: больше 255 выходов не помещается в однобайтовый счётчик
 */
TEST_F(TransactionTest, TooManyOutputs) {
    auto tx = make_sample();
    tx.outputs.assign(256, TxOutput{.value = 1, .script = {}});

    auto encoded = encode_transaction(tx);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code, ErrorCode::EncodingOverflow);

    tx.outputs.resize(255);
    EXPECT_TRUE(encode_transaction(tx).has_value());
}

/**
 * @brief Тест: скрипт длиннее 255 байт
 */
TEST_F(TransactionTest, ScriptTooLong) {
    auto tx = make_sample();
    tx.outputs[1].script.assign(256, 0x00);

    auto encoded = encode_transaction(tx);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code, ErrorCode::EncodingOverflow);
}

/**
 * @brief Тест: previous_txid не является 64 hex символами
 */
TEST_F(TransactionTest, InvalidPreviousTxid) {
    auto tx = make_sample();
    tx.inputs[0].previous_txid = "abcd";
    EXPECT_EQ(encode_transaction(tx).error().code, ErrorCode::InvalidIdentifier);

    tx.inputs[0].previous_txid = std::string(64, 'z');
    EXPECT_EQ(compute_txid(tx).error().code, ErrorCode::InvalidIdentifier);
}

/**
 * @brief Тест: обрезанные данные
 */
TEST_F(TransactionTest, DecodeTruncated) {
    auto encoded = encode_transaction(make_sample());
    ASSERT_TRUE(encoded.has_value());

    for (std::size_t len : {std::size_t{0}, std::size_t{3}, std::size_t{20}, encoded->size() - 1}) {
        auto decoded = decode_transaction(ByteSpan{encoded->data(), len});
        ASSERT_FALSE(decoded.has_value()) << "длина " << len;
        EXPECT_EQ(decoded.error().code, ErrorCode::MalformedInput);
    }
}

/**
 * @brief Тест: лишние байты после locktime
 */
TEST_F(TransactionTest, DecodeTrailingBytes) {
    auto encoded = encode_transaction(make_sample());
    ASSERT_TRUE(encoded.has_value());
    encoded->push_back(0x00);

    auto decoded = decode_transaction(*encoded);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::MalformedInput);
}

/**
 * @brief Тест: непустой scriptSig отклоняется
 */
TEST_F(TransactionTest, DecodeNonEmptyScriptSig) {
    auto encoded = encode_transaction(make_sample());
    ASSERT_TRUE(encoded.has_value());
    (*encoded)[41] = 0x01;

    EXPECT_EQ(decode_transaction(*encoded).error().code, ErrorCode::MalformedInput);
}

/**
 * @brief Тест: coinbase с sentinel идентификатором
 */
TEST_F(TransactionTest, Coinbase) {
    auto coinbase = make_coinbase({0x51});

    EXPECT_TRUE(coinbase.is_coinbase());
    EXPECT_EQ(coinbase.txid, constants::COINBASE_TXID);
    EXPECT_EQ(coinbase.total_output_value(), constants::COINBASE_SUBSIDY);
    EXPECT_FALSE(coinbase.fee.has_value());
    EXPECT_EQ(coinbase.inputs[0].output_index, constants::COINBASE_OUTPUT_INDEX);

    // Кодирование coinbase допустимо
    EXPECT_TRUE(encode_transaction(coinbase).has_value());

    EXPECT_FALSE(make_sample().is_coinbase());
}

/**
 * @brief Тест: P2PKH скрипт
 */
TEST_F(TransactionTest, P2pkhScript) {
    std::array<uint8_t, 20> pkh{};
    pkh.fill(0xab);
    auto script = make_p2pkh_script(pkh);

    ASSERT_EQ(script.size(), 25u);
    EXPECT_EQ(to_hex(script),
              "76a914abababababababababababababababababababab88ac");
}

} // namespace powledger::tests
