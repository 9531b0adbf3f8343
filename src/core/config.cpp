/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <format>
#include <vector>

namespace powledger {

namespace {

/**
 * @brief Прочитать неотрицательное целое из секции
 *
 * @return false если значение отрицательное или не помещается в T
 */
template<typename T>
[[nodiscard]] bool read_unsigned(const toml::table& section, std::string_view key, T& out) {
    if (auto val = section[key].value<int64_t>()) {
        if (*val < 0 || static_cast<uint64_t>(*val) > std::numeric_limits<T>::max()) {
            return false;
        }
        out = static_cast<T>(*val);
    }
    return true;
}

Result<Config> from_table(const toml::table& table) {
    Config config;

    auto out_of_range = [](std::string_view key) {
        return Err<Config>(
            ErrorCode::ConfigInvalidValue,
            std::format("Значение {} отрицательное или вне допустимого диапазона", key)
        );
    };

    // === Секция [ledger] ===
    if (auto ledger = table["ledger"].as_table()) {
        if (!read_unsigned(*ledger, "difficulty", config.ledger.difficulty)) {
            return out_of_range("ledger.difficulty");
        }
        if (!read_unsigned(*ledger, "max_attempts", config.ledger.max_attempts)) {
            return out_of_range("ledger.max_attempts");
        }
    }

    // === Секция [workload] ===
    if (auto workload = table["workload"].as_table()) {
        if (!read_unsigned(*workload, "seed", config.workload.seed)) {
            return out_of_range("workload.seed");
        }
        if (!read_unsigned(*workload, "fee", config.workload.fee)) {
            return out_of_range("workload.fee");
        }
        if (!read_unsigned(*workload, "faucet_value", config.workload.faucet_value)) {
            return out_of_range("workload.faucet_value");
        }
        if (!read_unsigned(*workload, "subsidy", config.workload.subsidy)) {
            return out_of_range("workload.subsidy");
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (!read_unsigned(*logging, "event_history", config.logging.event_history)) {
            return out_of_range("logging.event_history");
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

} // namespace

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view content) {
    try {
        auto table = toml::parse(content);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    if (path.has_value()) {
        return load(path.value());
    }

    // Стандартные пути
    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("powledger.toml");
    search_paths.push_back("/etc/powledger/powledger.toml");

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "powledger" / "powledger.toml"
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Config{};
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (ledger.difficulty < 1 || ledger.difficulty > constants::MAX_DIFFICULTY) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Сложность должна быть от 1 до {} (получено {})",
                        constants::MAX_DIFFICULTY, ledger.difficulty)
        );
    }

    if (workload.faucet_value <= workload.fee + constants::PAYMENT_MARGIN) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("faucet_value ({}) должен превышать fee + {} ({})",
                        workload.faucet_value, constants::PAYMENT_MARGIN,
                        workload.fee + constants::PAYMENT_MARGIN)
        );
    }

    if (std::ranges::find(constants::LOG_LEVEL_NAMES, logging.level) == constants::LOG_LEVEL_NAMES.end()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Уровень логирования должен быть error, warn, info или debug (получено '{}')",
                        logging.level)
        );
    }

    if (logging.event_history == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Размер истории событий не может быть 0"
        );
    }

    return {};
}

} // namespace powledger
