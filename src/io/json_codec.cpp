/**
 * @file json_codec.cpp
 * @brief Реализация JSON представления цепочки
 */

#include "json_codec.hpp"
#include "../core/hex.hpp"

namespace powledger::ledger {

void to_json(nlohmann::json& j, const TxInput& input) {
    j = nlohmann::json{
        {"previousTxId", input.previous_txid},
        {"outputIndex", input.output_index},
        {"sequence", input.sequence}
    };
}

void to_json(nlohmann::json& j, const TxOutput& output) {
    j = nlohmann::json{
        {"value", output.value},
        {"script", to_hex(output.script)}
    };
}

void to_json(nlohmann::json& j, const Transaction& tx) {
    j = nlohmann::json{
        {"txid", tx.txid},
        {"version", tx.version},
        {"inputs", tx.inputs},
        {"outputs", tx.outputs},
        {"locktime", tx.locktime},
        {"note", tx.note}
    };
    if (tx.fee) {
        j["fee"] = *tx.fee;
    }
}

void to_json(nlohmann::json& j, const Block& block) {
    j = nlohmann::json{
        {"index", block.header.index},
        {"timestamp", block.header.timestamp},
        {"previousHash", block.header.previous_hash},
        {"hash", block.hash},
        {"merkleRoot", block.header.merkle_root},
        {"nonce", block.header.nonce},
        {"transactions", block.transactions}
    };
}

void to_json(nlohmann::json& j, const BlockDiagnostics& diag) {
    j = nlohmann::json{
        {"index", diag.index},
        {"hash_valid", diag.hash_valid},
        {"pow_valid", diag.pow_valid},
        {"index_valid", diag.index_valid},
        {"prev_hash_valid", diag.prev_hash_valid},
        {"block_valid", diag.block_valid},
        {"cascaded", diag.cascaded}
    };
}

void to_json(nlohmann::json& j, const ChainVerdict& verdict) {
    j = nlohmann::json{
        {"valid", verdict.overall_valid},
        {"invalid_indices", verdict.invalid_indices},
        {"blocks", verdict.per_block}
    };
}

} // namespace powledger::ledger

namespace powledger::io {

namespace {

/**
 * @brief Первое присутствующее и не-null поле из списка имён
 */
template<std::size_t N>
[[nodiscard]] const json* find_field(const json& obj, const std::array<std::string_view, N>& aliases) {
    if (!obj.is_object()) {
        return nullptr;
    }
    for (auto alias : aliases) {
        auto it = obj.find(std::string(alias));
        if (it != obj.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

[[nodiscard]] const json* find_field(const json& obj, std::string_view key) {
    return find_field(obj, std::array<std::string_view, 1>{key});
}

[[nodiscard]] std::optional<uint64_t> as_unsigned(const json* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_unsigned()) {
        return value->get<uint64_t>();
    }
    if (value->is_number_integer()) {
        return unsigned_from_signed(value->get<int64_t>());
    }
    if (value->is_number_float()) {
        return unsigned_from_double(value->get<double>());
    }
    if (value->is_string()) {
        return parse_unsigned(value->get_ref<const std::string&>());
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<std::string> as_string(const json* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    if (value->is_number() || value->is_boolean()) {
        return value->dump();
    }
    return std::nullopt;
}

} // namespace

ledger::Transaction transaction_from_json(const json& j) {
    ledger::Transaction tx;
    tx.txid = as_string(find_field(j, "txid")).value_or("");
    tx.version = static_cast<uint32_t>(as_unsigned(find_field(j, "version")).value_or(constants::TX_VERSION));
    tx.locktime = static_cast<uint32_t>(as_unsigned(find_field(j, "locktime")).value_or(constants::TX_LOCKTIME));
    tx.note = as_string(find_field(j, "note")).value_or("");
    tx.fee = as_unsigned(find_field(j, "fee"));

    if (const json* inputs = find_field(j, "inputs"); inputs && inputs->is_array()) {
        for (const auto& item : *inputs) {
            ledger::TxInput input;
            input.previous_txid = as_string(find_field(item, INPUT_TXID_ALIASES)).value_or("");
            input.output_index = static_cast<uint32_t>(
                as_unsigned(find_field(item, INPUT_INDEX_ALIASES)).value_or(0));
            input.sequence = static_cast<uint32_t>(
                as_unsigned(find_field(item, "sequence")).value_or(constants::DEFAULT_SEQUENCE));
            tx.inputs.push_back(std::move(input));
        }
    }

    if (const json* outputs = find_field(j, "outputs"); outputs && outputs->is_array()) {
        for (const auto& item : *outputs) {
            ledger::TxOutput output;
            output.value = as_unsigned(find_field(item, "value")).value_or(0);
            auto script = as_string(find_field(item, OUTPUT_SCRIPT_ALIASES)).value_or("");
            output.script = from_hex(script).value_or(Bytes{});
            tx.outputs.push_back(std::move(output));
        }
    }

    return tx;
}

std::optional<std::vector<ledger::Transaction>> transactions_from_json(const json& j) {
    if (!j.is_array()) {
        return std::nullopt;
    }
    std::vector<ledger::Transaction> result;
    result.reserve(j.size());
    for (const auto& item : j) {
        result.push_back(transaction_from_json(item));
    }
    return result;
}

RawBlockRecord raw_block_from_json(const json& j) {
    RawBlockRecord record;
    record.index = as_unsigned(find_field(j, INDEX_ALIASES));
    record.timestamp = as_string(find_field(j, TIMESTAMP_ALIASES));
    record.previous_hash = as_string(find_field(j, PREVIOUS_HASH_ALIASES));
    record.hash = as_string(find_field(j, HASH_ALIASES));
    record.merkle_root = as_string(find_field(j, MERKLE_ROOT_ALIASES));
    record.nonce = as_unsigned(find_field(j, NONCE_ALIASES));
    if (const json* txs = find_field(j, TRANSACTIONS_ALIASES)) {
        record.transactions = transactions_from_json(*txs);
    }
    return record;
}

std::string chain_to_json(std::span<const ledger::Block> chain, int indent) {
    json root;
    root["chain"] = json::array();
    for (const auto& block : chain) {
        root["chain"].push_back(json(block));
    }
    return root.dump(indent);
}

std::optional<std::vector<RawBlockRecord>> chain_from_json(std::string_view content) {
    // Без исключений: discarded при ошибке разбора
    json root = json::parse(content, nullptr, false);
    if (root.is_discarded()) {
        return std::nullopt;
    }

    const json* blocks = nullptr;
    if (root.is_array()) {
        blocks = &root;
    } else if (const json* chain = find_field(root, "chain"); chain && chain->is_array()) {
        blocks = chain;
    }
    if (blocks == nullptr) {
        return std::nullopt;
    }

    std::vector<RawBlockRecord> records;
    records.reserve(blocks->size());
    for (const auto& item : *blocks) {
        records.push_back(raw_block_from_json(item));
    }
    return records;
}

} // namespace powledger::io
