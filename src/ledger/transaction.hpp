/**
 * @file transaction.hpp
 * @brief Транзакция и её каноническое кодирование
 *
 * Формат кодирования (все числа little-endian):
 * - version          4 байта
 * - input_count      1 байт
 * - для каждого входа:
 *   - prev_txid      32 байта (реверс display hex)
 *   - output_index   4 байта
 *   - script_len     1 байт, всегда 0 (скрипты входов не поддерживаются)
 *   - sequence       4 байта
 * - output_count     1 байт
 * - для каждого выхода:
 *   - value          8 байт
 *   - script_len     1 байт
 *   - script         script_len байт
 * - locktime         4 байта
 *
 * txid = reverse(SHA256d(encoding)) в hex.
 *
 * @note Счётчики и длины скриптов однобайтовые (максимум 255),
 *       это не Bitcoin varint.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace powledger::ledger {

/**
 * @brief Вход транзакции (ссылка на выход предыдущей транзакции)
 */
struct TxInput {
    /// @brief txid предыдущей транзакции (big-endian hex)
    std::string previous_txid;

    /// @brief Индекс выхода в предыдущей транзакции
    uint32_t output_index = 0;

    uint32_t sequence = constants::DEFAULT_SEQUENCE;

    [[nodiscard]] bool operator==(const TxInput&) const = default;
};

/**
 * @brief Выход транзакции
 */
struct TxOutput {
    /// @brief Сумма в базовых единицах
    uint64_t value = 0;

    /// @brief Непрозрачный скрипт (никогда не исполняется)
    Bytes script;

    [[nodiscard]] bool operator==(const TxOutput&) const = default;
};

/**
 * @brief Транзакция
 *
 * Поля txid, note и fee являются метаданными и не входят в кодирование.
 */
struct Transaction {
    uint32_t version = constants::TX_VERSION;
    std::vector<TxInput> inputs;
    std::vector<TxOutput> outputs;
    uint32_t locktime = constants::TX_LOCKTIME;

    /// @brief Вычисленный (или sentinel для coinbase) идентификатор
    std::string txid;

    /// @brief Описание сценария
    std::string note;

    /// @brief Комиссия (отсутствует у coinbase)
    std::optional<uint64_t> fee;

    /**
     * @brief Является ли транзакция coinbase
     *
     * Coinbase имеет ровно один вход с sentinel txid и индексом 0xFFFFFFFF.
     */
    [[nodiscard]] bool is_coinbase() const noexcept;

    /**
     * @brief Сумма всех выходов
     */
    [[nodiscard]] uint64_t total_output_value() const noexcept;

    [[nodiscard]] bool operator==(const Transaction&) const = default;
};

// =============================================================================
// Кодек
// =============================================================================

/**
 * @brief Закодировать транзакцию в каноническую последовательность байт
 *
 * @return Result<Bytes> Кодирование или ошибка:
 *         - EncodingOverflow: больше 255 входов/выходов или скрипт длиннее 255 байт
 *         - InvalidIdentifier: previous_txid не является 64 hex символами
 */
[[nodiscard]] Result<Bytes> encode_transaction(const Transaction& tx);

/**
 * @brief Разобрать каноническое кодирование
 *
 * Поля метаданных (txid, note, fee) остаются пустыми.
 *
 * @return Result<Transaction> Транзакция или MalformedInput
 *         при обрыве данных или лишних байтах в конце
 */
[[nodiscard]] Result<Transaction> decode_transaction(ByteSpan data);

/**
 * @brief Вычислить идентификатор транзакции
 *
 * Чистая функция содержимого: одинаковые поля дают одинаковый txid.
 * Для coinbase вычисляется так же; принудительный sentinel
 * назначает make_coinbase().
 */
[[nodiscard]] Result<std::string> compute_txid(const Transaction& tx);

/**
 * @brief Вычислить txid и записать его в tx.txid
 */
[[nodiscard]] Result<void> assign_txid(Transaction& tx);

// =============================================================================
// Конструкторы транзакций
// =============================================================================

/**
 * @brief Создать P2PKH-подобный скрипт
 *
 * Формат: OP_DUP OP_HASH160 <20 байт> OP_EQUALVERIFY OP_CHECKSIG
 */
[[nodiscard]] Bytes make_p2pkh_script(const std::array<uint8_t, 20>& pubkey_hash);

/**
 * @brief Создать coinbase транзакцию
 *
 * Один вход (sentinel txid, индекс 0xFFFFFFFF), один выход с наградой.
 * txid принудительно равен constants::COINBASE_TXID.
 *
 * @param script Скрипт получателя награды
 * @param subsidy Награда в базовых единицах
 */
[[nodiscard]] Transaction make_coinbase(Bytes script, uint64_t subsidy = constants::COINBASE_SUBSIDY);

} // namespace powledger::ledger
