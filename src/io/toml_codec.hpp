/**
 * @file toml_codec.hpp
 * @brief TOML представление цепочки (toml++)
 *
 * Та же структура, что и JSON:
 * @code
 * [[chain]]
 * index = 0
 * timestamp = "2024-01-01T12:00:00.000Z"
 * previousHash = "0"
 * ...
 *
 * [[chain.transactions]]
 * txid = "..."
 *
 * [[chain.transactions.inputs]]
 * previousTxId = "..."
 * @endcode
 *
 * @note TOML целые знаковые 64-битные: u64 значения пишутся через
 *       static_cast<int64_t> и восстанавливаются обратным приведением.
 */

#pragma once

#include "raw_block.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace powledger::io {

[[nodiscard]] toml::table transaction_to_toml(const ledger::Transaction& tx);

[[nodiscard]] toml::table block_to_toml(const ledger::Block& block);

/**
 * @brief Экспортировать цепочку в TOML текст
 */
[[nodiscard]] std::string chain_to_toml(std::span<const ledger::Block> chain);

/**
 * @brief Разобрать транзакцию из TOML таблицы
 */
[[nodiscard]] ledger::Transaction transaction_from_toml(const toml::table& table);

[[nodiscard]] RawBlockRecord raw_block_from_toml(const toml::table& table);

/**
 * @brief Разобрать цепочку из TOML текста
 *
 * @return std::nullopt если текст не TOML или нет массива таблиц "chain"
 */
[[nodiscard]] std::optional<std::vector<RawBlockRecord>> chain_from_toml(std::string_view content);

} // namespace powledger::io
