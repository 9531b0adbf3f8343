/**
 * @file miner.cpp
 * @brief Реализация перебора nonce
 */

#include "miner.hpp"

namespace powledger::ledger {

SearchResult search(
    BlockHeader header,
    uint32_t difficulty,
    uint64_t max_attempts,
    std::stop_token stop
) {
    SearchResult result;
    header.nonce = 0;

    while (true) {
        if (stop.stop_requested()) {
            result.status = SearchStatus::Cancelled;
            return result;
        }
        if (max_attempts != 0 && result.attempts >= max_attempts) {
            result.status = SearchStatus::Exhausted;
            return result;
        }

        result.nonce = header.nonce;
        result.hash = header.hash();
        ++result.attempts;

        if (meets_difficulty(result.hash, difficulty)) {
            result.status = SearchStatus::Found;
            return result;
        }
        ++header.nonce;
    }
}

} // namespace powledger::ledger
