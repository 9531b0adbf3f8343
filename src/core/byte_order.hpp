/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт (endianness)
 *
 * Числовые поля канонического кодирования транзакций пишутся в
 * little-endian, слова SHA256 читаются и пишутся в big-endian.
 */

#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

namespace powledger {

/**
 * @brief Concept для целочисленных типов фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> &&
                          (sizeof(T) == 1 || sizeof(T) == 2 ||
                           sizeof(T) == 4 || sizeof(T) == 8);

/**
 * @brief Преобразовать число из формата хоста в little-endian
 *
 * Операция симметрична: применяется и для обратного преобразования.
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T to_little_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else {
        return std::byteswap(value);
    }
}

/**
 * @brief Преобразовать число из формата хоста в big-endian
 */
template<UnsignedInteger T>
[[nodiscard]] constexpr T to_big_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        return value;
    } else {
        return std::byteswap(value);
    }
}

// =============================================================================
// Чтение/запись из/в байтовый массив
// =============================================================================

inline void write_le32(uint8_t* dest, uint32_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

inline void write_le64(uint8_t* dest, uint64_t value) noexcept {
    value = to_little_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

[[nodiscard]] inline uint32_t read_le32(const uint8_t* src) noexcept {
    uint32_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_little_endian(value);
}

[[nodiscard]] inline uint64_t read_le64(const uint8_t* src) noexcept {
    uint64_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_little_endian(value);
}

/**
 * @brief Записать uint32_t в big-endian формате
 *
 * @param dest Указатель на буфер (минимум 4 байта)
 * @param value Значение для записи
 */
inline void write_be32(uint8_t* dest, uint32_t value) noexcept {
    value = to_big_endian(value);
    std::memcpy(dest, &value, sizeof(value));
}

/**
 * @brief Прочитать uint32_t из big-endian буфера
 */
[[nodiscard]] inline uint32_t read_be32(const uint8_t* src) noexcept {
    uint32_t value;
    std::memcpy(&value, src, sizeof(value));
    return to_big_endian(value);
}

/**
 * @brief Реверсировать массив байт на месте
 *
 * Используется для преобразования идентификаторов между
 * display (big-endian hex) и internal (little-endian) форматами.
 */
inline void reverse_bytes(std::span<uint8_t> data) noexcept {
    auto begin = data.begin();
    auto end = data.end();
    while (begin < end) {
        --end;
        std::swap(*begin, *end);
        ++begin;
    }
}

} // namespace powledger
