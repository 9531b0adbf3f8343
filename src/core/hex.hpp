/**
 * @file hex.hpp
 * @brief Преобразование байт в hex строки и обратно
 *
 * Идентификаторы транзакций, хеши и скрипты выходов во всех внешних
 * представлениях хранятся как lowercase hex.
 */

#pragma once

#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace powledger {

/**
 * @brief Преобразовать байты в lowercase hex строку
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Разобрать hex строку произвольной длины
 *
 * @return std::nullopt при нечётной длине или не-hex символе
 */
[[nodiscard]] std::optional<Bytes> from_hex(std::string_view hex);

/**
 * @brief Разобрать 32-байтный идентификатор из big-endian hex
 *
 * Результат в little-endian (internal) порядке байт.
 *
 * @return std::nullopt если строка не является 64 hex символами
 */
[[nodiscard]] std::optional<Hash256> hash_from_display_hex(std::string_view hex);

/**
 * @brief Преобразовать internal (little-endian) хеш в display hex
 */
[[nodiscard]] std::string hash_to_display_hex(const Hash256& hash);

} // namespace powledger
