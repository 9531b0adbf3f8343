/**
 * @file config.hpp
 * @brief Конфигурация PoW Ledger
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 * Отсутствующие секции и ключи сохраняют значения по умолчанию.
 *
 * Пример конфигурации (powledger.toml):
 * @code
 * [ledger]
 * difficulty = 3
 * max_attempts = 0
 *
 * [workload]
 * seed = 0
 * fee = 10000
 * faucet_value = 50000000
 * subsidy = 5000000000
 *
 * [logging]
 * level = "info"
 * color = true
 * event_history = 200
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace powledger {

/**
 * @brief Параметры леджера
 */
struct LedgerConfig {
    /// @brief Ведущих '0' в hex хеше заголовка
    uint32_t difficulty = constants::DEFAULT_DIFFICULTY;

    /// @brief Лимит попыток перебора на блок, 0 = без ограничения
    uint64_t max_attempts = 0;
};

/**
 * @brief Параметры генератора нагрузки
 */
struct WorkloadConfig {
    /// @brief Seed ГПСЧ, 0 = std::random_device
    uint64_t seed = 0;

    uint64_t fee = constants::DEFAULT_FEE;
    uint64_t faucet_value = constants::FAUCET_VALUE;
    uint64_t subsidy = constants::COINBASE_SUBSIDY;
};

/**
 * @brief Настройки журнала событий
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Размер истории событий
    std::size_t event_history = 200;

    /// @brief Использовать цветной вывод
    bool color = true;
};

/**
 * @brief Полная конфигурация
 */
struct Config {
    LedgerConfig ledger;
    WorkloadConfig workload;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ConfigNotFound / ConfigParseError /
     *         ConfigInvalidValue (отрицательные числа)
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из TOML текста
     */
    [[nodiscard]] static Result<Config> parse(std::string_view content);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./powledger.toml
     * 3. /etc/powledger/powledger.toml
     * 4. ~/.config/powledger/powledger.toml
     *
     * Явно указанный, но отсутствующий путь даёт ConfigNotFound.
     * Если ни один стандартный файл не найден, возвращаются значения по умолчанию.
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * - difficulty в диапазоне 1..16
     * - faucet_value больше fee + запаса сдачи
     * - известный уровень логирования
     * - event_history > 0
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace powledger
