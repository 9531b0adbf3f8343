/**
 * @file workload.cpp
 * @brief Реализация генератора нагрузки
 */

#include "workload.hpp"
#include "../core/hex.hpp"

#include <algorithm>

namespace powledger::ledger {

namespace {

[[nodiscard]] uint64_t resolve_seed(uint64_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device device;
    return (static_cast<uint64_t>(device()) << 32) | device();
}

} // namespace

WorkloadGenerator::WorkloadGenerator(WorkloadConfig config)
    : config_(config)
    , rng_(resolve_seed(config.seed)) {}

template<std::size_t N>
std::array<uint8_t, N> WorkloadGenerator::random_bytes() {
    std::uniform_int_distribution<unsigned> dist(0, 255);
    std::array<uint8_t, N> result;
    for (auto& byte : result) {
        byte = static_cast<uint8_t>(dist(rng_));
    }
    return result;
}

Bytes WorkloadGenerator::random_script() {
    return make_p2pkh_script(random_bytes<20>());
}

std::string WorkloadGenerator::random_txid() {
    return to_hex(random_bytes<32>());
}

bool WorkloadGenerator::is_eligible(const UtxoEntry& entry) const noexcept {
    return !entry.spent && entry.value > config_.fee + constants::PAYMENT_MARGIN;
}

Result<Transaction> WorkloadGenerator::make_spend(const UtxoEntry& entry, std::string_view note) {
    // is_eligible гарантирует max_send >= 1
    const uint64_t max_send = entry.value - config_.fee - constants::PAYMENT_MARGIN;
    std::uniform_int_distribution<uint64_t> dist(1, max_send);
    const uint64_t payment = dist(rng_);
    const uint64_t change = entry.value - payment - config_.fee;

    Transaction tx;
    tx.inputs.push_back(TxInput{
        .previous_txid = entry.owning_txid,
        .output_index = entry.output_index,
        .sequence = constants::DEFAULT_SEQUENCE,
    });
    tx.outputs.push_back(TxOutput{.value = payment, .script = random_script()});
    tx.outputs.push_back(TxOutput{.value = change, .script = random_script()});
    tx.note = std::string(note);
    tx.fee = config_.fee;

    auto assigned = assign_txid(tx);
    if (!assigned) {
        return std::unexpected(assigned.error());
    }
    return tx;
}

Result<WorkloadRound> WorkloadGenerator::make_round(UtxoSet& utxo) {
    WorkloadRound round;

    std::vector<UtxoEntry> pool;
    for (auto& entry : utxo.list_available()) {
        if (is_eligible(entry)) {
            pool.push_back(std::move(entry));
        }
    }

    // Faucet выходы до пяти различных кандидатов
    while (pool.size() < constants::SPENDS_PER_ROUND) {
        std::string txid = random_txid();
        std::vector<TxOutput> outputs{TxOutput{.value = config_.faucet_value, .script = random_script()}};
        utxo.register_outputs(txid, outputs);

        auto entry = utxo.find(txid, 0);
        if (entry && is_eligible(*entry)) {
            pool.push_back(std::move(*entry));
        } else {
            return Err<WorkloadRound>(
                ErrorCode::ConfigInvalidValue,
                "faucet_value слишком мал для fee + запаса сдачи"
            );
        }
        round.faucets.push_back(std::move(txid));
    }

    round.transactions.reserve(constants::SPENDS_PER_ROUND + 1);
    round.transactions.push_back(make_coinbase(random_script(), config_.subsidy));

    // Выбор без возвращения
    for (std::size_t i = 0; i < constants::SPENDS_PER_ROUND; ++i) {
        std::uniform_int_distribution<std::size_t> pick(0, pool.size() - 1);
        std::size_t idx = pick(rng_);
        UtxoEntry chosen = std::move(pool[idx]);
        pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(idx));

        auto spend = make_spend(chosen, constants::SPEND_NOTES[i]);
        if (!spend) {
            return std::unexpected(spend.error());
        }
        round.transactions.push_back(std::move(*spend));
    }

    return round;
}

} // namespace powledger::ledger
