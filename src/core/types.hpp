/**
 * @file types.hpp
 * @brief Базовые типы для PoW Ledger
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (SHA256, txid, merkle root)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace powledger {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для:
 * - SHA256 хешей
 * - Transaction ID (txid)
 * - Merkle root
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 *
 * Используется для сериализации транзакций и скриптов выходов.
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Ошибки возвращаются как значения через Result<T>.
 * Исключения сторонних парсеров перехватываются на границе модуля io.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки кодирования (200-299)
    EncodingOverflow = 200,
    InvalidIdentifier = 201,
    MalformedInput = 202,

    // Ошибки майнинга (500-599)
    MiningExhausted = 500,
    MiningCancelled = 501,
    BlockConflict = 502,

    // Системные ошибки (800-899)
    SystemIOError = 801,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::EncodingOverflow: return "Поле не помещается в формат кодирования";
        case ErrorCode::InvalidIdentifier: return "Некорректный идентификатор";
        case ErrorCode::MalformedInput: return "Нераспознанные входные данные";
        case ErrorCode::MiningExhausted: return "Исчерпан лимит попыток майнинга";
        case ErrorCode::MiningCancelled: return "Майнинг отменён";
        case ErrorCode::BlockConflict: return "Конфликт входов в блоке";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * auto txid = ledger::compute_txid(tx);
 * if (!txid) {
 *     std::cerr << txid.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать успешный результат
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T&& value) {
    return Result<T>(std::forward<T>(value));
}

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace powledger
