/**
 * @file transaction.cpp
 * @brief Реализация кодека транзакций
 */

#include "transaction.hpp"
#include "../core/byte_order.hpp"
#include "../core/hex.hpp"
#include "../core/serialization/stream.hpp"
#include "../crypto/sha256.hpp"

#include <format>

namespace powledger::ledger {

using core::serialization::ReadStream;
using core::serialization::StreamError;
using core::serialization::WriteStream;

bool Transaction::is_coinbase() const noexcept {
    return inputs.size() == 1 &&
           inputs[0].previous_txid == constants::COINBASE_TXID &&
           inputs[0].output_index == constants::COINBASE_OUTPUT_INDEX;
}

uint64_t Transaction::total_output_value() const noexcept {
    uint64_t total = 0;
    for (const auto& output : outputs) {
        total += output.value;
    }
    return total;
}

// =============================================================================
// Кодирование
// =============================================================================

Result<Bytes> encode_transaction(const Transaction& tx) {
    if (tx.inputs.size() > constants::MAX_COMPACT_COUNT) {
        return Err<Bytes>(
            ErrorCode::EncodingOverflow,
            std::format("Слишком много входов: {} (максимум {})",
                        tx.inputs.size(), constants::MAX_COMPACT_COUNT)
        );
    }
    if (tx.outputs.size() > constants::MAX_COMPACT_COUNT) {
        return Err<Bytes>(
            ErrorCode::EncodingOverflow,
            std::format("Слишком много выходов: {} (максимум {})",
                        tx.outputs.size(), constants::MAX_COMPACT_COUNT)
        );
    }

    WriteStream stream(64 + tx.inputs.size() * 41 + tx.outputs.size() * 34);

    stream.write_u32_le(tx.version);

    stream.write_u8(static_cast<uint8_t>(tx.inputs.size()));
    for (std::size_t i = 0; i < tx.inputs.size(); ++i) {
        const auto& input = tx.inputs[i];

        // display hex -> little-endian байты
        auto prev = hash_from_display_hex(input.previous_txid);
        if (!prev) {
            return Err<Bytes>(
                ErrorCode::InvalidIdentifier,
                std::format("Вход {}: некорректный previous txid '{}'", i, input.previous_txid)
            );
        }
        stream.write_hash256(*prev);
        stream.write_u32_le(input.output_index);
        stream.write_u8(0);  // scriptSig всегда пустой
        stream.write_u32_le(input.sequence);
    }

    stream.write_u8(static_cast<uint8_t>(tx.outputs.size()));
    for (std::size_t i = 0; i < tx.outputs.size(); ++i) {
        const auto& output = tx.outputs[i];
        if (output.script.size() > constants::MAX_COMPACT_COUNT) {
            return Err<Bytes>(
                ErrorCode::EncodingOverflow,
                std::format("Выход {}: скрипт {} байт (максимум {})",
                            i, output.script.size(), constants::MAX_COMPACT_COUNT)
            );
        }
        stream.write_u64_le(output.value);
        stream.write_u8(static_cast<uint8_t>(output.script.size()));
        stream.write_bytes(output.script);
    }

    stream.write_u32_le(tx.locktime);

    return stream.take_data();
}

// =============================================================================
// Декодирование
// =============================================================================

Result<Transaction> decode_transaction(ByteSpan data) {
    ReadStream stream(data);
    Transaction tx;

    try {
        tx.version = stream.read_u32_le();

        uint8_t input_count = stream.read_u8();
        tx.inputs.reserve(input_count);
        for (uint8_t i = 0; i < input_count; ++i) {
            TxInput input;
            Hash256 prev = stream.read_hash256();
            input.previous_txid = hash_to_display_hex(prev);
            input.output_index = stream.read_u32_le();

            uint8_t script_len = stream.read_u8();
            if (script_len != 0) {
                return Err<Transaction>(
                    ErrorCode::MalformedInput,
                    std::format("Вход {}: ожидался пустой scriptSig, длина {}", i, script_len)
                );
            }
            input.sequence = stream.read_u32_le();
            tx.inputs.push_back(std::move(input));
        }

        uint8_t output_count = stream.read_u8();
        tx.outputs.reserve(output_count);
        for (uint8_t i = 0; i < output_count; ++i) {
            TxOutput output;
            output.value = stream.read_u64_le();
            uint8_t script_len = stream.read_u8();
            output.script = stream.read_bytes(script_len);
            tx.outputs.push_back(std::move(output));
        }

        tx.locktime = stream.read_u32_le();
    } catch (const StreamError& e) {
        return Err<Transaction>(ErrorCode::MalformedInput, e.what());
    }

    if (!stream.eof()) {
        return Err<Transaction>(
            ErrorCode::MalformedInput,
            std::format("Лишние {} байт после locktime", stream.remaining())
        );
    }

    return tx;
}

// =============================================================================
// Идентификатор
// =============================================================================

Result<std::string> compute_txid(const Transaction& tx) {
    auto encoded = encode_transaction(tx);
    if (!encoded) {
        return std::unexpected(encoded.error());
    }

    Hash256 digest = crypto::sha256d(*encoded);

    // Display порядок: реверс дайджеста
    return hash_to_display_hex(digest);
}

Result<void> assign_txid(Transaction& tx) {
    auto txid = compute_txid(tx);
    if (!txid) {
        return std::unexpected(txid.error());
    }
    tx.txid = std::move(*txid);
    return {};
}

// =============================================================================
// Конструкторы
// =============================================================================

Bytes make_p2pkh_script(const std::array<uint8_t, 20>& pubkey_hash) {
    Bytes script;
    script.reserve(25);
    script.push_back(0x76);  // OP_DUP
    script.push_back(0xa9);  // OP_HASH160
    script.push_back(0x14);  // push 20
    script.insert(script.end(), pubkey_hash.begin(), pubkey_hash.end());
    script.push_back(0x88);  // OP_EQUALVERIFY
    script.push_back(0xac);  // OP_CHECKSIG
    return script;
}

Transaction make_coinbase(Bytes script, uint64_t subsidy) {
    Transaction tx;
    tx.inputs.push_back(TxInput{
        .previous_txid = std::string(constants::COINBASE_TXID),
        .output_index = constants::COINBASE_OUTPUT_INDEX,
        .sequence = constants::DEFAULT_SEQUENCE,
    });
    tx.outputs.push_back(TxOutput{
        .value = subsidy,
        .script = std::move(script),
    });
    tx.txid = std::string(constants::COINBASE_TXID);
    tx.note = "Coinbase reward";
    return tx;
}

} // namespace powledger::ledger
