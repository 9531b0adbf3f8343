/**
 * @file merkle.hpp
 * @brief Merkle root над идентификаторами транзакций блока
 */

#pragma once

#include "../core/types.hpp"

#include <string>
#include <vector>

namespace powledger::ledger {

/**
 * @brief Объединить два узла Merkle дерева
 *
 * Узлы хранятся в internal (little-endian) порядке. Результат
 * SHA256d(left || right) реверсируется, чтобы следующий уровень
 * оставался в том же порядке.
 */
[[nodiscard]] Hash256 merkle_hash(const Hash256& left, const Hash256& right) noexcept;

/**
 * @brief Вычислить Merkle root из списка txid
 *
 * Алгоритм:
 * 1. Каждый txid (big-endian hex) переводится в little-endian байты
 * 2. На уровне с нечётным количеством узлов последний дублируется
 * 3. Пары объединяются через merkle_hash() до одного узла
 * 4. Корень реверсируется обратно в display hex
 *
 * Пустой список даёт 64 символа '0', один txid возвращается без изменений.
 * Результат зависит от порядка txid.
 *
 * @param txids Идентификаторы в порядке транзакций блока
 * @return Result<std::string> Корень или InvalidIdentifier
 */
[[nodiscard]] Result<std::string> compute_merkle_root(const std::vector<std::string>& txids);

} // namespace powledger::ledger
