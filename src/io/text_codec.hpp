/**
 * @file text_codec.hpp
 * @brief Текстовое представление цепочки
 *
 * Каждый блок начинается строкой "---", далее поля по одному на строке:
 * @code
 * ---
 * Index: 1
 * Timestamp: 2024-01-01T12:00:00.000Z
 * Previous Hash: 000a...
 * Hash: 000b...
 * MerkleRoot: 4e3f...
 * Transactions: [{"txid":"...", ...}]
 * Nonce: 1234
 * @endcode
 *
 * При разборе метки сравниваются без учёта регистра, значение отделяется
 * первым ':'. Записи без Index или Nonce пропускаются.
 */

#pragma once

#include "raw_block.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace powledger::io {

/**
 * @brief Экспортировать цепочку в текст
 */
[[nodiscard]] std::string chain_to_text(std::span<const ledger::Block> chain);

/**
 * @brief Разобрать записи из текста
 *
 * @return Список записей (пустой, если ни одной не распознано)
 */
[[nodiscard]] std::vector<RawBlockRecord> chain_from_text(std::string_view content);

} // namespace powledger::io
