/**
 * @file toml_codec.cpp
 * @brief Реализация TOML представления цепочки
 */

#include "toml_codec.hpp"
#include "../core/hex.hpp"

#include <sstream>

namespace powledger::io {

namespace {

[[nodiscard]] int64_t to_toml_int(uint64_t value) noexcept {
    return static_cast<int64_t>(value);
}

template<std::size_t N>
[[nodiscard]] const toml::node* find_field(
    const toml::table& table,
    const std::array<std::string_view, N>& aliases
) {
    for (auto alias : aliases) {
        if (const toml::node* node = table.get(alias)) {
            return node;
        }
    }
    return nullptr;
}

[[nodiscard]] const toml::node* find_field(const toml::table& table, std::string_view key) {
    return table.get(key);
}

[[nodiscard]] std::optional<uint64_t> as_unsigned(const toml::node* node) {
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return unsigned_from_signed(node->value<int64_t>().value_or(-1));
    }
    if (auto v = node->value<double>()) {
        return unsigned_from_double(*v);
    }
    if (auto s = node->value<std::string>()) {
        return parse_unsigned(*s);
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<std::string> as_string(const toml::node* node) {
    if (node == nullptr) {
        return std::nullopt;
    }
    if (auto s = node->value<std::string>()) {
        return *s;
    }
    if (auto v = node->value<int64_t>()) {
        return std::to_string(*v);
    }
    if (auto b = node->value<bool>()) {
        return *b ? "true" : "false";
    }
    return std::nullopt;
}

} // namespace

// =============================================================================
// Экспорт
// =============================================================================

toml::table transaction_to_toml(const ledger::Transaction& tx) {
    toml::array inputs;
    for (const auto& input : tx.inputs) {
        inputs.push_back(toml::table{
            {"previousTxId", input.previous_txid},
            {"outputIndex", to_toml_int(input.output_index)},
            {"sequence", to_toml_int(input.sequence)},
        });
    }

    toml::array outputs;
    for (const auto& output : tx.outputs) {
        outputs.push_back(toml::table{
            {"value", to_toml_int(output.value)},
            {"script", to_hex(output.script)},
        });
    }

    toml::table table{
        {"txid", tx.txid},
        {"version", to_toml_int(tx.version)},
        {"inputs", std::move(inputs)},
        {"outputs", std::move(outputs)},
        {"locktime", to_toml_int(tx.locktime)},
        {"note", tx.note},
    };
    if (tx.fee) {
        table.insert("fee", to_toml_int(*tx.fee));
    }
    return table;
}

toml::table block_to_toml(const ledger::Block& block) {
    toml::array transactions;
    for (const auto& tx : block.transactions) {
        transactions.push_back(transaction_to_toml(tx));
    }

    return toml::table{
        {"index", to_toml_int(block.header.index)},
        {"timestamp", block.header.timestamp},
        {"previousHash", block.header.previous_hash},
        {"hash", block.hash},
        {"merkleRoot", block.header.merkle_root},
        {"nonce", to_toml_int(block.header.nonce)},
        {"transactions", std::move(transactions)},
    };
}

std::string chain_to_toml(std::span<const ledger::Block> chain) {
    toml::array blocks;
    for (const auto& block : chain) {
        blocks.push_back(block_to_toml(block));
    }

    toml::table root{{"chain", std::move(blocks)}};

    std::ostringstream out;
    out << root << '\n';
    return out.str();
}

// =============================================================================
// Импорт
// =============================================================================

ledger::Transaction transaction_from_toml(const toml::table& table) {
    ledger::Transaction tx;
    tx.txid = as_string(find_field(table, "txid")).value_or("");
    tx.version = static_cast<uint32_t>(as_unsigned(find_field(table, "version")).value_or(constants::TX_VERSION));
    tx.locktime = static_cast<uint32_t>(as_unsigned(find_field(table, "locktime")).value_or(constants::TX_LOCKTIME));
    tx.note = as_string(find_field(table, "note")).value_or("");
    tx.fee = as_unsigned(find_field(table, "fee"));

    if (const toml::node* node = find_field(table, "inputs")) {
        if (const toml::array* inputs = node->as_array()) {
            for (const auto& item : *inputs) {
                const toml::table* in = item.as_table();
                if (in == nullptr) continue;

                ledger::TxInput input;
                input.previous_txid = as_string(find_field(*in, INPUT_TXID_ALIASES)).value_or("");
                input.output_index = static_cast<uint32_t>(
                    as_unsigned(find_field(*in, INPUT_INDEX_ALIASES)).value_or(0));
                input.sequence = static_cast<uint32_t>(
                    as_unsigned(find_field(*in, "sequence")).value_or(constants::DEFAULT_SEQUENCE));
                tx.inputs.push_back(std::move(input));
            }
        }
    }

    if (const toml::node* node = find_field(table, "outputs")) {
        if (const toml::array* outputs = node->as_array()) {
            for (const auto& item : *outputs) {
                const toml::table* out = item.as_table();
                if (out == nullptr) continue;

                ledger::TxOutput output;
                output.value = as_unsigned(find_field(*out, "value")).value_or(0);
                auto script = as_string(find_field(*out, OUTPUT_SCRIPT_ALIASES)).value_or("");
                output.script = from_hex(script).value_or(Bytes{});
                tx.outputs.push_back(std::move(output));
            }
        }
    }

    return tx;
}

RawBlockRecord raw_block_from_toml(const toml::table& table) {
    RawBlockRecord record;
    record.index = as_unsigned(find_field(table, INDEX_ALIASES));
    record.timestamp = as_string(find_field(table, TIMESTAMP_ALIASES));
    record.previous_hash = as_string(find_field(table, PREVIOUS_HASH_ALIASES));
    record.hash = as_string(find_field(table, HASH_ALIASES));
    record.merkle_root = as_string(find_field(table, MERKLE_ROOT_ALIASES));
    record.nonce = as_unsigned(find_field(table, NONCE_ALIASES));

    if (const toml::node* node = find_field(table, TRANSACTIONS_ALIASES)) {
        if (const toml::array* txs = node->as_array()) {
            std::vector<ledger::Transaction> transactions;
            for (const auto& item : *txs) {
                if (const toml::table* tx = item.as_table()) {
                    transactions.push_back(transaction_from_toml(*tx));
                }
            }
            record.transactions = std::move(transactions);
        }
    }
    return record;
}

std::optional<std::vector<RawBlockRecord>> chain_from_toml(std::string_view content) {
    toml::table root;
    try {
        root = toml::parse(content);
    } catch (const toml::parse_error&) {
        return std::nullopt;
    }

    const toml::array* blocks = root["chain"].as_array();
    if (blocks == nullptr) {
        return std::nullopt;
    }

    std::vector<RawBlockRecord> records;
    records.reserve(blocks->size());
    for (const auto& item : *blocks) {
        if (const toml::table* block = item.as_table()) {
            records.push_back(raw_block_from_toml(*block));
        } else {
            records.push_back(RawBlockRecord{});
        }
    }
    return records;
}

} // namespace powledger::io
