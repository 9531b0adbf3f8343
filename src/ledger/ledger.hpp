/**
 * @file ledger.hpp
 * @brief Леджер: цепочка блоков и множество выходов
 *
 * Единственная точка изменения состояния. Не синхронизирован:
 * один экземпляр на поток.
 */

#pragma once

#include "block.hpp"
#include "chain_validator.hpp"
#include "miner.hpp"
#include "utxo_set.hpp"
#include "workload.hpp"
#include "../core/config.hpp"
#include "../core/constants.hpp"

#include <optional>
#include <stop_token>
#include <vector>

namespace powledger::log {
class EventLog;
}

namespace powledger::ledger {

using powledger::LedgerConfig;

/**
 * @brief Краткое описание транзакции добытого блока
 */
struct TxSummary {
    std::string txid;
    std::string note;
    std::vector<TxInput> inputs;
    std::vector<TxOutput> outputs;
    std::optional<uint64_t> fee;
};

/**
 * @brief Результат раунда майнинга
 */
struct MineResult {
    Block block;
    std::vector<TxSummary> summaries;
    ChainVerdict verdict;
};

/**
 * @brief Леджер
 *
 * Создаётся через create(): генезис-блок майнится при той же сложности,
 * после чего регистрируется предзаполненный выход.
 */
class Ledger {
public:
    /**
     * @brief Создать леджер с добытым генезис-блоком
     *
     * @param config Параметры
     * @param events Журнал событий (не владеет), может быть nullptr
     * @param stop Токен отмены майнинга генезиса
     * @return Result<Ledger> Леджер или MiningExhausted / MiningCancelled
     */
    [[nodiscard]] static Result<Ledger> create(
        LedgerConfig config,
        log::EventLog* events = nullptr,
        std::stop_token stop = {}
    );

    /**
     * @brief Добыть блок из готовых транзакций
     *
     * Фазы:
     * 1. Проверка: каждый вход (кроме sentinel coinbase) ссылается на
     *    непотраченный выход и встречается в блоке один раз, иначе
     *    BlockConflict
     * 2. Перебор nonce: MiningExhausted / MiningCancelled
     * 3. Фиксация: блок добавляется, входы тратятся, выходы регистрируются
     *
     * При ошибке на фазах 1-2 состояние леджера не меняется.
     */
    [[nodiscard]] Result<Block> mine_block(
        std::vector<Transaction> transactions,
        std::stop_token stop = {}
    );

    /**
     * @brief Сгенерировать раунд и добыть блок
     */
    [[nodiscard]] Result<MineResult> mine_round(
        WorkloadGenerator& generator,
        std::stop_token stop = {}
    );

    /**
     * @brief Проверить входы блока без изменения состояния
     */
    [[nodiscard]] Result<void> check_inputs(const std::vector<Transaction>& transactions) const;

    /**
     * @brief Проверить всю цепочку
     */
    [[nodiscard]] ChainVerdict validate() const;

    [[nodiscard]] const std::vector<Block>& chain() const noexcept { return chain_; }
    [[nodiscard]] const Block& tip() const noexcept { return chain_.back(); }
    [[nodiscard]] const UtxoSet& utxo() const noexcept { return utxo_; }
    [[nodiscard]] UtxoSet& utxo() noexcept { return utxo_; }
    [[nodiscard]] uint32_t difficulty() const noexcept { return config_.difficulty; }
    [[nodiscard]] const LedgerConfig& config() const noexcept { return config_; }

private:
    Ledger(LedgerConfig config, log::EventLog* events);

    /**
     * @brief Перебрать nonce для подготовленного блока
     */
    [[nodiscard]] Result<void> mine_header(Block& block, std::stop_token stop) const;

    void commit(Block block);

    LedgerConfig config_;
    log::EventLog* events_;
    std::vector<Block> chain_;
    UtxoSet utxo_;
};

} // namespace powledger::ledger
