/**
 * @file json_codec.hpp
 * @brief JSON представление цепочки (nlohmann/json)
 *
 * Экспорт: {"chain": [ {index, timestamp, previousHash, hash, merkleRoot,
 * nonce, transactions: [...]}, ... ]}
 *
 * Импорт принимает как объект с ключом "chain", так и голый массив блоков.
 */

#pragma once

#include "raw_block.hpp"
#include "../ledger/chain_validator.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace powledger::ledger {

void to_json(nlohmann::json& j, const TxInput& input);
void to_json(nlohmann::json& j, const TxOutput& output);
void to_json(nlohmann::json& j, const Transaction& tx);
void to_json(nlohmann::json& j, const Block& block);
void to_json(nlohmann::json& j, const BlockDiagnostics& diag);
void to_json(nlohmann::json& j, const ChainVerdict& verdict);

} // namespace powledger::ledger

namespace powledger::io {

using json = nlohmann::json;

/**
 * @brief Экспортировать цепочку в JSON текст
 *
 * @param indent Отступ, -1 = компактно
 */
[[nodiscard]] std::string chain_to_json(std::span<const ledger::Block> chain, int indent = 2);

/**
 * @brief Разобрать транзакцию из JSON
 *
 * Отсутствующие или неверного типа поля получают значения по умолчанию.
 * Скрипт, не являющийся hex, становится пустым.
 */
[[nodiscard]] ledger::Transaction transaction_from_json(const json& j);

/**
 * @brief Разобрать список транзакций (nullopt если j не массив)
 */
[[nodiscard]] std::optional<std::vector<ledger::Transaction>> transactions_from_json(const json& j);

/**
 * @brief Разобрать блок из JSON объекта по спискам имён полей
 */
[[nodiscard]] RawBlockRecord raw_block_from_json(const json& j);

/**
 * @brief Разобрать цепочку из JSON текста
 *
 * @return std::nullopt если текст не JSON или не содержит массив блоков
 */
[[nodiscard]] std::optional<std::vector<RawBlockRecord>> chain_from_json(std::string_view content);

} // namespace powledger::io
