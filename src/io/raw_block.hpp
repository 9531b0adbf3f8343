/**
 * @file raw_block.hpp
 * @brief Запись блока из внешнего файла до нормализации
 *
 * Каждое поле ищется по упорядоченному списку имён; первое найденное
 * имя побеждает. Отсутствующие поля получают значения по умолчанию
 * (пустая строка, 0, пустой список транзакций).
 */

#pragma once

#include "../ledger/block.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace powledger::io {

// =============================================================================
// Имена полей
// =============================================================================

inline constexpr std::array<std::string_view, 3> INDEX_ALIASES = {"idx", "index", "Index"};
inline constexpr std::array<std::string_view, 3> TIMESTAMP_ALIASES = {"ts", "timestamp", "Timestamp"};
inline constexpr std::array<std::string_view, 4> PREVIOUS_HASH_ALIASES = {
    "prevHash", "previousHash", "previous_hash", "Previous Hash"
};
inline constexpr std::array<std::string_view, 2> HASH_ALIASES = {"hash", "Hash"};
inline constexpr std::array<std::string_view, 3> MERKLE_ROOT_ALIASES = {
    "merkleRoot", "merkle_root", "MerkleRoot"
};
inline constexpr std::array<std::string_view, 2> NONCE_ALIASES = {"nonce", "Nonce"};
inline constexpr std::array<std::string_view, 4> TRANSACTIONS_ALIASES = {
    "transactions", "data", "Data", "Transactions"
};

// Имена полей транзакции (экспорт использует первое)
inline constexpr std::array<std::string_view, 2> INPUT_TXID_ALIASES = {"previousTxId", "txid"};
inline constexpr std::array<std::string_view, 2> INPUT_INDEX_ALIASES = {"outputIndex", "index"};
inline constexpr std::array<std::string_view, 2> OUTPUT_SCRIPT_ALIASES = {"script", "scriptPubKey"};

/**
 * @brief Блок в том виде, в каком он прочитан из файла
 */
struct RawBlockRecord {
    std::optional<uint64_t> index;
    std::optional<std::string> timestamp;
    std::optional<std::string> previous_hash;
    std::optional<std::string> hash;
    std::optional<std::string> merkle_root;
    std::optional<uint64_t> nonce;
    std::optional<std::vector<ledger::Transaction>> transactions;

    /**
     * @brief Привести к блоку, подставив значения по умолчанию
     */
    [[nodiscard]] ledger::Block normalize() const;
};

/**
 * @brief Разобрать неотрицательное десятичное число
 *
 * Пробелы по краям допускаются.
 */
[[nodiscard]] std::optional<uint64_t> parse_unsigned(std::string_view text) noexcept;

/**
 * @brief Неотрицательное целое из знакового числа файла
 */
[[nodiscard]] std::optional<uint64_t> unsigned_from_signed(int64_t value) noexcept;

/**
 * @brief Неотрицательное целое из числа с плавающей точкой
 *
 * NaN, бесконечность, отрицательные значения и значения от 2^64
 * дают nullopt. Дробная часть отбрасывается.
 */
[[nodiscard]] std::optional<uint64_t> unsigned_from_double(double value) noexcept;

/**
 * @brief Сравнить строки без учёта регистра ASCII
 */
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

} // namespace powledger::io
