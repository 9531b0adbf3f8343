/**
 * @file sha256.hpp
 * @brief SHA256 интерфейс
 *
 * Предоставляет:
 * - Потоковый SHA256 (update/finalize) для данных произвольной длины
 * - Однократный SHA256 для хеша заголовка блока
 * - Double SHA256 (SHA256d) для txid и Merkle дерева
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace powledger::crypto {

/**
 * @brief SHA256 состояние (8 x 32-bit слов)
 */
using Sha256State = std::array<uint32_t, 8>;

/**
 * @brief Потоковый SHA256 хешер
 *
 * Полная реализация SHA256 согласно FIPS 180-4.
 *
 * Пример:
 * @code
 * Sha256 hasher;
 * hasher.update(header_part1);
 * hasher.update(header_part2);
 * Hash256 digest = hasher.finalize();
 * @endcode
 */
class Sha256 {
public:
    Sha256() noexcept;

    /**
     * @brief Добавить данные
     */
    Sha256& update(ByteSpan data) noexcept;

    /**
     * @brief Добавить строку (байты без завершающего нуля)
     */
    Sha256& update(std::string_view data) noexcept;

    /**
     * @brief Завершить вычисление и получить хеш
     *
     * После вызова хешер сбрасывается в начальное состояние.
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    /**
     * @brief Сбросить хешер в начальное состояние
     */
    void reset() noexcept;

private:
    Sha256State state_;
    std::array<uint8_t, constants::SHA256_BLOCK_SIZE> buffer_{};
    std::size_t buffered_ = 0;
    uint64_t total_len_ = 0;
};

/**
 * @brief Функция сжатия SHA256 для одного 64-байтного блока
 *
 * @param state Текущее состояние хеша (будет модифицировано)
 * @param block Указатель на 64 байта данных
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;

/**
 * @brief Вычислить SHA256 хеш данных произвольной длины
 *
 * @param data Входные данные для хеширования
 * @return Hash256 32-байтный хеш (в порядке вывода FIPS, без реверса)
 */
[[nodiscard]] Hash256 sha256(ByteSpan data) noexcept;

/**
 * @brief Вычислить SHA256 хеш строки
 */
[[nodiscard]] Hash256 sha256(std::string_view data) noexcept;

/**
 * @brief Вычислить SHA256d (двойной SHA256) хеш
 *
 * SHA256d = SHA256(SHA256(data))
 *
 * Используется для:
 * - Transaction ID (txid)
 * - Узлов Merkle дерева
 */
[[nodiscard]] Hash256 sha256d(ByteSpan data) noexcept;

/**
 * @brief SHA256 строки в виде lowercase hex
 *
 * Используется для хеша заголовка блока (pipe-joined строка).
 */
[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace powledger::crypto
