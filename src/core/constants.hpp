/**
 * @file constants.hpp
 * @brief Константы леджера
 *
 * Содержит магические значения, размеры полей кодирования и
 * параметры генератора нагрузки по умолчанию.
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace powledger::constants {

// =============================================================================
// Размеры
// =============================================================================

/// @brief Размер SHA256 хеша в байтах
inline constexpr std::size_t SHA256_SIZE = 32;

/// @brief Длина hex-представления txid / хеша
inline constexpr std::size_t HASH_HEX_SIZE = SHA256_SIZE * 2;

/// @brief Размер блока SHA256 (один transform) в байтах
inline constexpr std::size_t SHA256_BLOCK_SIZE = 64;

/// @brief Максимум входов/выходов и длина скрипта (однобайтовое поле длины)
inline constexpr std::size_t MAX_COMPACT_COUNT = 0xFF;

// =============================================================================
// Транзакции
// =============================================================================

/// @brief Версия транзакции
inline constexpr uint32_t TX_VERSION = 1;

/// @brief Locktime всех транзакций
inline constexpr uint32_t TX_LOCKTIME = 0;

/// @brief Sequence по умолчанию
inline constexpr uint32_t DEFAULT_SEQUENCE = 0xFFFFFFFF;

/// @brief Индекс выхода coinbase входа
inline constexpr uint32_t COINBASE_OUTPUT_INDEX = 0xFFFFFFFF;

/**
 * @brief Sentinel идентификатор coinbase
 *
 * Используется и как previousTxId входа coinbase, и как её txid.
 * Литерал сохранён побайтно как в исходных данных (64 hex символа).
 */
inline constexpr std::string_view COINBASE_TXID =
    "0000000000000000000000000000000000000000000000000000000000000000";

/// @brief Награда coinbase: 50 монет в базовых единицах
inline constexpr uint64_t COINBASE_SUBSIDY = 50ULL * 100'000'000ULL;

// =============================================================================
// Цепочка
// =============================================================================

/// @brief previousHash генезис-блока
inline constexpr std::string_view GENESIS_PREVIOUS_HASH = "0";

/// @brief Сложность по умолчанию (количество ведущих нулей в hex)
inline constexpr uint32_t DEFAULT_DIFFICULTY = 3;

/// @brief Максимально допустимая сложность в конфигурации
inline constexpr uint32_t MAX_DIFFICULTY = 16;

/// @brief Предзаполненный выход, регистрируемый после генезиса
inline constexpr std::string_view SEED_TXID =
    "48437ddb190b006f858cdd881284ad467d68bfc4c74f3e6f621eb5af33be88d8";
inline constexpr uint64_t SEED_VALUE = 100'000'000;
inline constexpr std::string_view SEED_SCRIPT =
    "76a9141d0f172a0ecb48aee1be1f2687d2963ae33f71a188ac";

// =============================================================================
// Генератор нагрузки
// =============================================================================

/// @brief Количество обычных транзакций в раунде (плюс одна coinbase)
inline constexpr std::size_t SPENDS_PER_ROUND = 5;

/// @brief Фиксированная комиссия
inline constexpr uint64_t DEFAULT_FEE = 10'000;

/// @brief Запас, оставляемый под сдачу при выборе суммы платежа
inline constexpr uint64_t PAYMENT_MARGIN = 1'000;

/// @brief Номинал faucet выхода
inline constexpr uint64_t FAUCET_VALUE = 50'000'000;

/// @brief Описания сценариев для транзакций раунда
inline constexpr std::array<std::string_view, SPENDS_PER_ROUND> SPEND_NOTES = {
    "Alice pays Bob (shopping)",
    "Charlie pays Dave (peer payment)",
    "Eve buys coffee",
    "Donation to charity",
    "Micro tip to content creator",
};

// =============================================================================
// Журнал событий
// =============================================================================

/// @brief Имена уровней логирования в порядке убывания важности
inline constexpr std::array<std::string_view, 4> LOG_LEVEL_NAMES = {
    "error", "warn", "info", "debug"
};

// =============================================================================
// Начальные значения SHA256 (H0-H7)
// =============================================================================

/// @brief Начальные значения хеша SHA256 (FIPS 180-4)
inline constexpr std::array<uint32_t, 8> SHA256_INIT = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

/// @brief Константы раунда SHA256 (первые 32 бита дробной части кубических корней простых чисел)
inline constexpr std::array<uint32_t, 64> SHA256_K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

} // namespace powledger::constants
