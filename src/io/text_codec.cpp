/**
 * @file text_codec.cpp
 * @brief Реализация текстового представления цепочки
 */

#include "text_codec.hpp"
#include "json_codec.hpp"

#include <cctype>
#include <format>
#include <utility>

namespace powledger::io {

namespace {

using Fields = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] std::string_view trim(std::string_view text) noexcept {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

/**
 * @brief Значение первого поля, совпавшего с одним из имён
 *
 * Имена перебираются по порядку; метки сравниваются без учёта регистра.
 */
template<std::size_t N>
[[nodiscard]] std::optional<std::string> find_field(
    const Fields& fields,
    const std::array<std::string_view, N>& aliases
) {
    for (auto alias : aliases) {
        for (const auto& [label, value] : fields) {
            if (iequals(label, alias)) {
                return value;
            }
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<RawBlockRecord> parse_section(const Fields& fields) {
    auto index = find_field(fields, INDEX_ALIASES);
    auto nonce = find_field(fields, NONCE_ALIASES);
    if (!index || !nonce) {
        return std::nullopt;
    }

    RawBlockRecord record;
    record.index = parse_unsigned(*index);
    record.nonce = parse_unsigned(*nonce);
    record.timestamp = find_field(fields, TIMESTAMP_ALIASES);
    record.previous_hash = find_field(fields, PREVIOUS_HASH_ALIASES);
    record.hash = find_field(fields, HASH_ALIASES);
    record.merkle_root = find_field(fields, MERKLE_ROOT_ALIASES);

    if (auto data = find_field(fields, TRANSACTIONS_ALIASES);
        data && (data->starts_with('[') || data->starts_with('{'))) {
        json parsed = json::parse(*data, nullptr, false);
        if (!parsed.is_discarded()) {
            record.transactions = transactions_from_json(parsed);
        }
    }
    return record;
}

} // namespace

std::string chain_to_text(std::span<const ledger::Block> chain) {
    std::string out;
    for (const auto& block : chain) {
        json transactions = block.transactions;
        out += "---\n";
        out += std::format("Index: {}\n", block.header.index);
        out += std::format("Timestamp: {}\n", block.header.timestamp);
        out += std::format("Previous Hash: {}\n", block.header.previous_hash);
        out += std::format("Hash: {}\n", block.hash);
        out += std::format("MerkleRoot: {}\n", block.header.merkle_root);
        out += std::format("Transactions: {}\n", transactions.dump());
        out += std::format("Nonce: {}\n", block.header.nonce);
    }
    return out;
}

std::vector<RawBlockRecord> chain_from_text(std::string_view content) {
    std::vector<RawBlockRecord> records;
    Fields fields;

    auto flush = [&]() {
        if (auto record = parse_section(fields)) {
            records.push_back(std::move(*record));
        }
        fields.clear();
    };

    while (!content.empty()) {
        auto eol = content.find('\n');
        std::string_view line = trim(content.substr(0, eol));
        content.remove_prefix(eol == std::string_view::npos ? content.size() : eol + 1);

        if (line == "---") {
            flush();
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        fields.emplace_back(std::string(trim(line.substr(0, colon))),
                            std::string(trim(line.substr(colon + 1))));
    }
    flush();

    return records;
}

} // namespace powledger::io
