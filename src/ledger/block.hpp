/**
 * @file block.hpp
 * @brief Блок леджера и хеш его заголовка
 *
 * Заголовок сериализуется в строку через '|':
 *   index|timestamp|previousHash|merkleRoot|nonce
 * Хеш заголовка = SHA256 этой строки в lowercase hex (одинарный, не SHA256d).
 */

#pragma once

#include "transaction.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace powledger::ledger {

/**
 * @brief Поля заголовка блока, участвующие в хеше
 */
struct BlockHeader {
    uint64_t index = 0;

    /// @brief ISO-8601 UTC с миллисекундами, фиксируется при создании
    std::string timestamp;

    std::string previous_hash;
    std::string merkle_root;

    /// @brief Переменная перебора
    uint64_t nonce = 0;

    /**
     * @brief Строковое представление заголовка для хеширования
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Вычислить хеш заголовка
     *
     * @return std::string SHA256 от to_string() в lowercase hex
     */
    [[nodiscard]] std::string hash() const;

    [[nodiscard]] bool operator==(const BlockHeader&) const = default;
};

/**
 * @brief Блок цепочки
 *
 * После добавления в цепочку не изменяется.
 */
struct Block {
    BlockHeader header;
    std::vector<Transaction> transactions;

    /// @brief Хеш заголовка, найденный майнингом
    std::string hash;

    [[nodiscard]] bool operator==(const Block&) const = default;
};

/**
 * @brief Проверить, что хеш удовлетворяет сложности
 *
 * @param hash Хеш в hex
 * @param difficulty Требуемое количество ведущих символов '0'
 */
[[nodiscard]] bool meets_difficulty(std::string_view hash, uint32_t difficulty) noexcept;

/**
 * @brief Текущее время в формате 2024-01-01T12:00:00.000Z
 */
[[nodiscard]] std::string current_timestamp();

/**
 * @brief Подготовить блок к майнингу
 *
 * Вычисляет Merkle root по txid транзакций, фиксирует timestamp,
 * nonce = 0 и хеш начального заголовка.
 *
 * @return Result<Block> Блок или InvalidIdentifier для некорректного txid
 */
[[nodiscard]] Result<Block> make_block(
    uint64_t index,
    std::string previous_hash,
    std::vector<Transaction> transactions
);

} // namespace powledger::ledger
