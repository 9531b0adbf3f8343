/**
 * @file chain_validator.hpp
 * @brief Проверка целостности цепочки
 *
 * Живая цепочка и импортированные данные приводятся к BlockRecord
 * и проверяются одним и тем же проходом.
 */

#pragma once

#include "block.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace powledger::ledger {

/**
 * @brief Нормализованная запись блока (только поля заголовка и хеш)
 */
struct BlockRecord {
    uint64_t index = 0;
    std::string timestamp;
    std::string previous_hash;
    std::string merkle_root;
    uint64_t nonce = 0;
    std::string hash;

    [[nodiscard]] BlockHeader header() const;

    [[nodiscard]] bool operator==(const BlockRecord&) const = default;
};

/**
 * @brief Результаты проверок одного блока
 */
struct BlockDiagnostics {
    /// @brief Индекс из записи (не позиция в последовательности)
    uint64_t index = 0;

    /// @brief Пересчитанный хеш заголовка совпадает с сохранённым
    bool hash_valid = false;

    /// @brief Сохранённый хеш имеет difficulty ведущих '0'
    bool pow_valid = false;

    /// @brief 0 на позиции 0, иначе индекс предыдущей записи + 1
    bool index_valid = false;

    /// @brief "0" на позиции 0, иначе хеш предыдущей записи
    bool prev_hash_valid = false;

    bool block_valid = false;

    /// @brief Какой-то более ранний блок уже невалиден
    bool cascaded = false;

    [[nodiscard]] bool operator==(const BlockDiagnostics&) const = default;
};

/**
 * @brief Вердикт по цепочке
 */
struct ChainVerdict {
    bool overall_valid = true;

    /// @brief Индексы (из записей) невалидных блоков по порядку
    std::vector<uint64_t> invalid_indices;

    std::vector<BlockDiagnostics> per_block;

    [[nodiscard]] bool operator==(const ChainVerdict&) const = default;
};

/**
 * @brief Валидатор цепочки при фиксированной сложности
 *
 * Первый невалидный блок делает невалидными все последующие
 * (cascaded), даже если их собственные проверки проходят.
 */
class ChainValidator {
public:
    explicit ChainValidator(uint32_t difficulty) noexcept;

    /**
     * @brief Проверить последовательность записей
     *
     * Не завершается ошибкой: любой вход даёт вердикт.
     * Пустая последовательность валидна.
     */
    [[nodiscard]] ChainVerdict validate(std::span<const BlockRecord> records) const;

    [[nodiscard]] uint32_t difficulty() const noexcept { return difficulty_; }

private:
    [[nodiscard]] BlockDiagnostics check_block(
        std::span<const BlockRecord> records,
        std::size_t position
    ) const;

    uint32_t difficulty_;
};

/**
 * @brief Привести блок к записи валидатора
 */
[[nodiscard]] BlockRecord to_record(const Block& block);

[[nodiscard]] std::vector<BlockRecord> to_records(std::span<const Block> blocks);

/**
 * @brief Проверить последовательность записей при сложности difficulty
 */
[[nodiscard]] ChainVerdict validate_chain(
    std::span<const BlockRecord> records,
    uint32_t difficulty
);

} // namespace powledger::ledger
