/**
 * @file chain_io.cpp
 * @brief Реализация экспорта и импорта цепочки
 */

#include "chain_io.hpp"
#include "json_codec.hpp"
#include "text_codec.hpp"
#include "toml_codec.hpp"

#include <cctype>
#include <format>
#include <fstream>
#include <sstream>

namespace powledger::io {

namespace {

[[nodiscard]] char first_significant(std::string_view content) noexcept {
    for (char c : content) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return c;
        }
    }
    return '\0';
}

[[nodiscard]] ImportResult make_result(
    const std::vector<RawBlockRecord>& records,
    ChainFormat format,
    uint32_t difficulty
) {
    ImportResult result;
    result.difficulty = difficulty;
    result.format = format;
    result.blocks.reserve(records.size());
    for (const auto& record : records) {
        result.blocks.push_back(record.normalize());
    }

    auto normalized = ledger::to_records(result.blocks);
    result.verdict = ledger::validate_chain(normalized, difficulty);
    return result;
}

} // namespace

std::optional<ChainFormat> parse_format(std::string_view name) noexcept {
    if (iequals(name, "json")) return ChainFormat::Json;
    if (iequals(name, "toml")) return ChainFormat::Toml;
    if (iequals(name, "txt") || iequals(name, "text")) return ChainFormat::Text;
    return std::nullopt;
}

std::string export_chain(std::span<const ledger::Block> chain, ChainFormat format) {
    switch (format) {
        case ChainFormat::Json:
            return chain_to_json(chain);
        case ChainFormat::Toml:
            return chain_to_toml(chain);
        case ChainFormat::Text:
            return chain_to_text(chain);
    }
    return {};
}

Result<ImportResult> import_chain(std::string_view content, uint32_t difficulty) {
    char first = first_significant(content);
    if (first == '{' || first == '[') {
        if (auto records = chain_from_json(content)) {
            return make_result(*records, ChainFormat::Json, difficulty);
        }
    }

    if (auto records = chain_from_toml(content)) {
        return make_result(*records, ChainFormat::Toml, difficulty);
    }

    auto records = chain_from_text(content);
    if (!records.empty()) {
        return make_result(records, ChainFormat::Text, difficulty);
    }

    return Err<ImportResult>(
        ErrorCode::MalformedInput,
        "Неподдерживаемый или повреждённый файл цепочки"
    );
}

Result<ImportResult> import_file(const std::filesystem::path& path, uint32_t difficulty) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<ImportResult>(
            ErrorCode::SystemIOError,
            std::format("Не удалось открыть файл: {}", path.string())
        );
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Err<ImportResult>(
            ErrorCode::SystemIOError,
            std::format("Ошибка чтения файла: {}", path.string())
        );
    }

    return import_chain(buffer.str(), difficulty);
}

} // namespace powledger::io
