/**
 * @file chain_io.hpp
 * @brief Экспорт и импорт цепочки
 *
 * Форматы: JSON (nlohmann/json), TOML (toml++), текст ("---" записи).
 * Импорт определяет формат сам:
 * 1. Первый непробельный символ '{' или '[': JSON; при ошибке разбора дальше
 * 2. TOML с массивом таблиц "chain"
 * 3. Текстовые записи
 * Ничего не распознано: MalformedInput.
 */

#pragma once

#include "../core/types.hpp"
#include "../ledger/block.hpp"
#include "../ledger/chain_validator.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace powledger::io {

/**
 * @brief Формат файла цепочки
 */
enum class ChainFormat {
    Json,
    Toml,
    Text
};

[[nodiscard]] constexpr std::string_view to_string(ChainFormat format) noexcept {
    switch (format) {
        case ChainFormat::Json: return "json";
        case ChainFormat::Toml: return "toml";
        case ChainFormat::Text: return "txt";
    }
    return "unknown";
}

/**
 * @brief Разобрать имя формата ("json", "toml", "txt"/"text")
 */
[[nodiscard]] std::optional<ChainFormat> parse_format(std::string_view name) noexcept;

/**
 * @brief Результат импорта
 */
struct ImportResult {
    /// @brief Сложность, при которой выполнена проверка
    uint32_t difficulty = 0;

    /// @brief Распознанный формат
    ChainFormat format = ChainFormat::Json;

    /// @brief Нормализованные блоки в порядке файла
    std::vector<ledger::Block> blocks;

    ledger::ChainVerdict verdict;
};

/**
 * @brief Экспортировать цепочку
 */
[[nodiscard]] std::string export_chain(std::span<const ledger::Block> chain, ChainFormat format);

/**
 * @brief Импортировать цепочку из текста и проверить её
 *
 * @param content Содержимое файла
 * @param difficulty Сложность для проверки PoW
 * @return Result<ImportResult> Результат или MalformedInput
 */
[[nodiscard]] Result<ImportResult> import_chain(std::string_view content, uint32_t difficulty);

/**
 * @brief Прочитать файл и импортировать цепочку
 *
 * @return Result<ImportResult> Результат, SystemIOError или MalformedInput
 */
[[nodiscard]] Result<ImportResult> import_file(const std::filesystem::path& path, uint32_t difficulty);

} // namespace powledger::io
