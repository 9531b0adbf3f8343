/**
 * @file utxo_set.cpp
 * @brief Реализация множества выходов
 */

#include "utxo_set.hpp"

namespace powledger::ledger {

void UtxoSet::register_outputs(const std::string& txid, const std::vector<TxOutput>& outputs) {
    std::vector<UtxoEntry> list;
    list.reserve(outputs.size());
    for (std::size_t i = 0; i < outputs.size(); ++i) {
        list.push_back(UtxoEntry{
            .owning_txid = txid,
            .output_index = static_cast<uint32_t>(i),
            .value = outputs[i].value,
            .script = outputs[i].script,
            .spent = false,
        });
    }

    auto [it, inserted] = entries_.insert_or_assign(txid, std::move(list));
    if (inserted) {
        order_.push_back(txid);
    }
}

const UtxoEntry* UtxoSet::lookup(std::string_view txid, uint32_t output_index) const {
    auto it = entries_.find(std::string(txid));
    if (it == entries_.end() || output_index >= it->second.size()) {
        return nullptr;
    }
    return &it->second[output_index];
}

bool UtxoSet::spend(std::string_view txid, uint32_t output_index) {
    auto it = entries_.find(std::string(txid));
    if (it == entries_.end() || output_index >= it->second.size()) {
        return false;
    }

    auto& entry = it->second[output_index];
    if (entry.spent) {
        return false;
    }
    entry.spent = true;
    return true;
}

std::vector<UtxoEntry> UtxoSet::list_available() const {
    std::vector<UtxoEntry> result;
    for (const auto& txid : order_) {
        for (const auto& entry : entries_.at(txid)) {
            if (!entry.spent) {
                result.push_back(entry);
            }
        }
    }
    return result;
}

bool UtxoSet::is_spendable(std::string_view txid, uint32_t output_index) const {
    const auto* entry = lookup(txid, output_index);
    return entry != nullptr && !entry->spent;
}

std::optional<UtxoEntry> UtxoSet::find(std::string_view txid, uint32_t output_index) const {
    const auto* entry = lookup(txid, output_index);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return *entry;
}

std::size_t UtxoSet::entry_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [txid, list] : entries_) {
        count += list.size();
    }
    return count;
}

std::size_t UtxoSet::unspent_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [txid, list] : entries_) {
        for (const auto& entry : list) {
            if (!entry.spent) ++count;
        }
    }
    return count;
}

uint64_t UtxoSet::unspent_value() const noexcept {
    uint64_t total = 0;
    for (const auto& [txid, list] : entries_) {
        for (const auto& entry : list) {
            if (!entry.spent) total += entry.value;
        }
    }
    return total;
}

} // namespace powledger::ledger
