/**
 * @file utxo_set.hpp
 * @brief Множество непотраченных выходов (UTXO)
 *
 * In-memory хранилище выходов, индексированных по (txid, output_index).
 * Записи никогда не удаляются: трата только выставляет флаг spent.
 */

#pragma once

#include "transaction.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace powledger::ledger {

/**
 * @brief Запись множества выходов
 */
struct UtxoEntry {
    /// @brief txid транзакции, создавшей выход
    std::string owning_txid;

    uint32_t output_index = 0;
    uint64_t value = 0;
    Bytes script;

    /// @brief Выход уже потрачен
    bool spent = false;

    [[nodiscard]] bool operator==(const UtxoEntry&) const = default;
};

/**
 * @brief Множество выходов с флагами траты
 *
 * Порядок обхода детерминирован: порядок первой регистрации txid,
 * затем индекс выхода. Не синхронизировано, владелец один.
 */
class UtxoSet {
public:
    UtxoSet() = default;

    /**
     * @brief Зарегистрировать выходы транзакции как непотраченные
     *
     * Индекс выхода равен его позиции. Повторная регистрация того же txid
     * заменяет прежний список, сохраняя исходную позицию в порядке обхода.
     */
    void register_outputs(const std::string& txid, const std::vector<TxOutput>& outputs);

    /**
     * @brief Потратить выход
     *
     * @return true если запись существовала и не была потрачена.
     *         Отсутствующий или уже потраченный выход даёт false.
     */
    bool spend(std::string_view txid, uint32_t output_index);

    /**
     * @brief Снимок непотраченных записей в порядке обхода
     */
    [[nodiscard]] std::vector<UtxoEntry> list_available() const;

    /**
     * @brief Существует ли непотраченная запись
     */
    [[nodiscard]] bool is_spendable(std::string_view txid, uint32_t output_index) const;

    /**
     * @brief Найти запись (потраченную или нет)
     */
    [[nodiscard]] std::optional<UtxoEntry> find(std::string_view txid, uint32_t output_index) const;

    /// @brief Всего записей, включая потраченные
    [[nodiscard]] std::size_t entry_count() const noexcept;

    [[nodiscard]] std::size_t unspent_count() const noexcept;

    /// @brief Сумма непотраченных выходов
    [[nodiscard]] uint64_t unspent_value() const noexcept;

private:
    [[nodiscard]] const UtxoEntry* lookup(std::string_view txid, uint32_t output_index) const;

    /// @brief txid в порядке первой регистрации
    std::vector<std::string> order_;

    std::unordered_map<std::string, std::vector<UtxoEntry>> entries_;
};

} // namespace powledger::ledger
