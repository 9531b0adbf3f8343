/**
 * @file ledger.cpp
 * @brief Реализация леджера
 */

#include "ledger.hpp"
#include "../core/hex.hpp"
#include "../log/event_log.hpp"

#include <format>
#include <set>
#include <utility>

namespace powledger::ledger {

Ledger::Ledger(LedgerConfig config, log::EventLog* events)
    : config_(config)
    , events_(events) {}

Result<Ledger> Ledger::create(LedgerConfig config, log::EventLog* events, std::stop_token stop) {
    Ledger ledger(config, events);

    auto genesis = make_block(0, std::string(constants::GENESIS_PREVIOUS_HASH), {});
    if (!genesis) {
        return std::unexpected(genesis.error());
    }

    auto mined = ledger.mine_header(*genesis, stop);
    if (!mined) {
        if (events) events->log_block_rejected(mined.error());
        return std::unexpected(mined.error());
    }
    ledger.chain_.push_back(std::move(*genesis));
    if (events) events->log_genesis(ledger.tip().hash);

    // Предзаполненный выход
    auto script = from_hex(constants::SEED_SCRIPT);
    ledger.utxo_.register_outputs(
        std::string(constants::SEED_TXID),
        {TxOutput{.value = constants::SEED_VALUE, .script = script.value_or(Bytes{})}}
    );

    return ledger;
}

Result<void> Ledger::check_inputs(const std::vector<Transaction>& transactions) const {
    std::set<std::pair<std::string, uint32_t>> referenced;

    for (const auto& tx : transactions) {
        for (const auto& input : tx.inputs) {
            if (input.previous_txid == constants::COINBASE_TXID) {
                continue;
            }
            if (!utxo_.is_spendable(input.previous_txid, input.output_index)) {
                return Err<void>(
                    ErrorCode::BlockConflict,
                    std::format("Транзакция {}: выход {}:{} отсутствует или потрачен",
                                tx.txid, input.previous_txid, input.output_index)
                );
            }
            if (!referenced.emplace(input.previous_txid, input.output_index).second) {
                return Err<void>(
                    ErrorCode::BlockConflict,
                    std::format("Транзакция {}: выход {}:{} уже используется в блоке",
                                tx.txid, input.previous_txid, input.output_index)
                );
            }
        }
    }
    return {};
}

Result<void> Ledger::mine_header(Block& block, std::stop_token stop) const {
    auto result = search(block.header, config_.difficulty, config_.max_attempts, stop);

    switch (result.status) {
        case SearchStatus::Found:
            block.header.nonce = result.nonce;
            block.hash = std::move(result.hash);
            if (events_) {
                events_->log_block_mined(block.header.index, block.header.nonce,
                                         block.hash, result.attempts);
            }
            return {};
        case SearchStatus::Exhausted:
            return Err<void>(
                ErrorCode::MiningExhausted,
                std::format("Блок #{}: nonce не найден за {} попыток",
                            block.header.index, result.attempts)
            );
        case SearchStatus::Cancelled:
            break;
    }
    return Err<void>(
        ErrorCode::MiningCancelled,
        std::format("Блок #{}: майнинг отменён после {} попыток",
                    block.header.index, result.attempts)
    );
}

void Ledger::commit(Block block) {
    chain_.push_back(std::move(block));

    for (const auto& tx : chain_.back().transactions) {
        for (const auto& input : tx.inputs) {
            if (input.previous_txid == constants::COINBASE_TXID) {
                continue;
            }
            if (!utxo_.spend(input.previous_txid, input.output_index) && events_) {
                events_->log_spend_failed(input.previous_txid, input.output_index);
            }
        }
        utxo_.register_outputs(tx.txid, tx.outputs);
    }
}

Result<Block> Ledger::mine_block(std::vector<Transaction> transactions, std::stop_token stop) {
    auto checked = check_inputs(transactions);
    if (!checked) {
        if (events_) events_->log_block_rejected(checked.error());
        return std::unexpected(checked.error());
    }

    auto block = make_block(tip().header.index + 1, tip().hash, std::move(transactions));
    if (!block) {
        if (events_) events_->log_block_rejected(block.error());
        return std::unexpected(block.error());
    }

    auto mined = mine_header(*block, stop);
    if (!mined) {
        if (events_) events_->log_block_rejected(mined.error());
        return std::unexpected(mined.error());
    }

    commit(*block);
    return tip();
}

Result<MineResult> Ledger::mine_round(WorkloadGenerator& generator, std::stop_token stop) {
    auto round = generator.make_round(utxo_);
    if (!round) {
        if (events_) events_->log_error(round.error().message);
        return std::unexpected(round.error());
    }

    if (events_) {
        for (const auto& txid : round->faucets) {
            events_->log_faucet(txid, generator.config().faucet_value);
        }
    }

    auto block = mine_block(std::move(round->transactions), stop);
    if (!block) {
        return std::unexpected(block.error());
    }

    MineResult result;
    result.block = std::move(*block);
    result.summaries.reserve(result.block.transactions.size());
    for (const auto& tx : result.block.transactions) {
        result.summaries.push_back(TxSummary{
            .txid = tx.txid,
            .note = tx.note,
            .inputs = tx.inputs,
            .outputs = tx.outputs,
            .fee = tx.fee,
        });
    }
    result.verdict = validate();
    return result;
}

ChainVerdict Ledger::validate() const {
    auto records = to_records(chain_);
    return validate_chain(records, config_.difficulty);
}

} // namespace powledger::ledger
