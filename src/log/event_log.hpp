/**
 * @file event_log.hpp
 * @brief Терминальный журнал событий леджера
 *
 * Каждое событие:
 * - сохраняется в кольцевой буфер ограниченного размера
 * - выводится строкой "[LEVEL] [TYPE] сообщение", если уровень проходит фильтр
 * - подсвечивается ANSI цветом при color = true
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace powledger::log {

// =============================================================================
// Уровни и типы событий
// =============================================================================

/**
 * @brief Уровень важности (по возрастанию подробности)
 */
enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "UNKNOWN";
}

/**
 * @brief Разобрать уровень из конфигурации ("error", "warn", "info", "debug")
 */
[[nodiscard]] std::optional<LogLevel> parse_level(std::string_view name) noexcept;

/**
 * @brief Тип события для логирования
 */
enum class EventType {
    GENESIS,          ///< Создан генезис-блок
    BLOCK_MINED,      ///< Блок найден и добавлен
    BLOCK_REJECTED,   ///< Блок отклонён до майнинга или майнинг прерван
    SPEND_FAILED,     ///< spend() вернул false при фиксации
    FAUCET,           ///< В множество добавлен faucet выход
    IMPORT_OK,        ///< Импорт разобран
    IMPORT_FAIL,      ///< Импорт не распознан
    ERROR             ///< Ошибка
};

[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::GENESIS:        return "GENESIS";
        case EventType::BLOCK_MINED:    return "BLOCK_MINED";
        case EventType::BLOCK_REJECTED: return "BLOCK_REJECTED";
        case EventType::SPEND_FAILED:   return "SPEND_FAILED";
        case EventType::FAUCET:         return "FAUCET";
        case EventType::IMPORT_OK:      return "IMPORT_OK";
        case EventType::IMPORT_FAIL:    return "IMPORT_FAIL";
        case EventType::ERROR:          return "ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Уровень, с которым выводится событие данного типа
 */
[[nodiscard]] constexpr LogLevel level_of(EventType type) noexcept {
    switch (type) {
        case EventType::ERROR:
            return LogLevel::Error;
        case EventType::BLOCK_REJECTED:
        case EventType::SPEND_FAILED:
        case EventType::IMPORT_FAIL:
            return LogLevel::Warn;
        case EventType::FAUCET:
            return LogLevel::Debug;
        default:
            return LogLevel::Info;
    }
}

/**
 * @brief Запись события
 */
struct EventRecord {
    EventType type;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
};

using powledger::LoggingConfig;

// =============================================================================
// Event Log
// =============================================================================

/**
 * @brief Журнал событий леджера
 *
 * Без потока вывода (sink == nullptr) события только накапливаются в истории.
 */
class EventLog {
public:
    /**
     * @brief Создать журнал
     *
     * @param config Конфигурация логирования
     * @param sink Поток вывода строк (не владеет), nullptr = без вывода
     */
    explicit EventLog(const LoggingConfig& config, std::ostream* sink = nullptr);

    ~EventLog();

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    /**
     * @brief Записать событие
     */
    void log_event(EventType type, const std::string& message);

    void log_genesis(std::string_view hash);
    void log_block_mined(uint64_t index, uint64_t nonce, std::string_view hash, uint64_t attempts);
    void log_block_rejected(const Error& error);
    void log_spend_failed(std::string_view txid, uint32_t output_index);
    void log_faucet(std::string_view txid, uint64_t value);
    void log_import(bool success, const std::string& message);
    void log_error(const std::string& message);

    /**
     * @brief Снимок истории (от старых к новым)
     */
    [[nodiscard]] std::vector<EventRecord> events() const;

    /**
     * @brief Количество событий в истории
     */
    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Выводится ли событие данного типа при текущем уровне
     */
    [[nodiscard]] bool enabled(EventType type) const noexcept;

    /**
     * @brief Последние count событий текстом (без ANSI кодов)
     *
     * Используется для команды history и тестирования.
     */
    [[nodiscard]] std::string render_plain(std::size_t count = 10) const;

    /**
     * @brief Строка вывода для события
     */
    [[nodiscard]] std::string format_line(const EventRecord& record, bool use_color) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace powledger::log
