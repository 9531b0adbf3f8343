/**
 * @file miner.hpp
 * @brief Перебор nonce заголовка блока
 */

#pragma once

#include "block.hpp"

#include <cstdint>
#include <stop_token>
#include <string>

namespace powledger::ledger {

/**
 * @brief Итог перебора
 */
enum class SearchStatus {
    Found,      ///< Найден nonce, удовлетворяющий сложности
    Exhausted,  ///< Исчерпан лимит попыток
    Cancelled,  ///< Запрошена остановка через stop_token
};

[[nodiscard]] constexpr std::string_view to_string(SearchStatus status) noexcept {
    switch (status) {
        case SearchStatus::Found: return "found";
        case SearchStatus::Exhausted: return "exhausted";
        case SearchStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Результат перебора
 */
struct SearchResult {
    SearchStatus status = SearchStatus::Exhausted;

    /// @brief Найденный (или последний проверенный) nonce
    uint64_t nonce = 0;

    /// @brief Хеш заголовка с этим nonce (пусто, если попыток не было)
    std::string hash;

    /// @brief Количество вычисленных хешей
    uint64_t attempts = 0;

    [[nodiscard]] bool found() const noexcept {
        return status == SearchStatus::Found;
    }
};

/**
 * @brief Найти nonce, при котором хеш заголовка имеет difficulty ведущих '0'
 *
 * Перебор начинается с nonce = 0 независимо от header.nonce.
 * Остановка проверяется перед каждой попыткой.
 *
 * @param header Заголовок (nonce игнорируется)
 * @param difficulty Количество ведущих нулей в hex
 * @param max_attempts Лимит попыток, 0 = без ограничения
 * @param stop Токен кооперативной отмены
 */
[[nodiscard]] SearchResult search(
    BlockHeader header,
    uint32_t difficulty,
    uint64_t max_attempts = 0,
    std::stop_token stop = {}
);

} // namespace powledger::ledger
