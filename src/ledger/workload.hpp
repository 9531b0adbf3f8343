/**
 * @file workload.hpp
 * @brief Генератор синтетических транзакций
 *
 * Раунд = coinbase + 5 трат различных непотраченных выходов.
 */

#pragma once

#include "transaction.hpp"
#include "utxo_set.hpp"
#include "../core/config.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace powledger::ledger {

using powledger::WorkloadConfig;

/**
 * @brief Сгенерированный раунд
 */
struct WorkloadRound {
    /// @brief coinbase первой, затем траты
    std::vector<Transaction> transactions;

    /// @brief txid faucet выходов, добавленных в множество в этом раунде
    std::vector<std::string> faucets;
};

/**
 * @brief Генератор раундов транзакций
 *
 * Каждая трата: 1 вход, 2 выхода (платёж и сдача).
 * payment + change + fee = стоимость входа.
 *
 * Выходы дешевле fee + PAYMENT_MARGIN + 1 не выбираются. Если подходящих
 * выходов меньше пяти, в множество добавляются faucet выходы, так что
 * все траты раунда ссылаются на различные записи.
 */
class WorkloadGenerator {
public:
    explicit WorkloadGenerator(WorkloadConfig config = {});

    /**
     * @brief Сгенерировать раунд
     *
     * Мутирует utxo только добавлением faucet выходов; траты
     * применяет леджер при фиксации блока.
     */
    [[nodiscard]] Result<WorkloadRound> make_round(UtxoSet& utxo);

    /**
     * @brief Случайный P2PKH-подобный скрипт
     */
    [[nodiscard]] Bytes random_script();

    /**
     * @brief Случайный 32-байтный идентификатор в hex
     */
    [[nodiscard]] std::string random_txid();

    /**
     * @brief Может ли выход быть потрачен генератором
     */
    [[nodiscard]] bool is_eligible(const UtxoEntry& entry) const noexcept;

    [[nodiscard]] const WorkloadConfig& config() const noexcept { return config_; }

private:
    template<std::size_t N>
    [[nodiscard]] std::array<uint8_t, N> random_bytes();

    [[nodiscard]] Result<Transaction> make_spend(const UtxoEntry& entry, std::string_view note);

    WorkloadConfig config_;
    std::mt19937_64 rng_;
};

} // namespace powledger::ledger
