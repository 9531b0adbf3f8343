/**
 * @file event_log.cpp
 * @brief Реализация журнала событий
 */

#include "event_log.hpp"

#include <algorithm>
#include <deque>
#include <format>
#include <mutex>
#include <ostream>
#include <sstream>

namespace powledger::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";

    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

namespace {

[[nodiscard]] const char* color_of(EventType type) noexcept {
    switch (type) {
        case EventType::GENESIS:
        case EventType::IMPORT_OK:
            return ansi::CYAN;
        case EventType::BLOCK_MINED:
            return ansi::GREEN;
        case EventType::BLOCK_REJECTED:
        case EventType::SPEND_FAILED:
        case EventType::IMPORT_FAIL:
            return ansi::YELLOW;
        case EventType::FAUCET:
            return ansi::DIM;
        case EventType::ERROR:
            return ansi::RED;
    }
    return ansi::RESET;
}

} // namespace

std::optional<LogLevel> parse_level(std::string_view name) noexcept {
    const auto& names = constants::LOG_LEVEL_NAMES;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

// =============================================================================
// Реализация
// =============================================================================

struct EventLog::Impl {
    LoggingConfig config;
    LogLevel threshold;
    std::ostream* sink;

    std::deque<EventRecord> events;
    mutable std::mutex events_mutex;

    Impl(const LoggingConfig& cfg, std::ostream* out)
        : config(cfg)
        , threshold(parse_level(cfg.level).value_or(LogLevel::Info))
        , sink(out) {}
};

EventLog::EventLog(const LoggingConfig& config, std::ostream* sink)
    : impl_(std::make_unique<Impl>(config, sink)) {}

EventLog::~EventLog() = default;

bool EventLog::enabled(EventType type) const noexcept {
    return level_of(type) <= impl_->threshold;
}

std::string EventLog::format_line(const EventRecord& record, bool use_color) const {
    const char* bold = use_color ? ansi::BOLD : "";
    const char* color = use_color ? color_of(record.type) : "";
    const char* reset = use_color ? ansi::RESET : "";

    return std::format("{}[{}]{} {}[{}]{} {}",
                       bold, to_string(level_of(record.type)), reset,
                       color, to_string(record.type), reset,
                       record.message);
}

void EventLog::log_event(EventType type, const std::string& message) {
    std::lock_guard<std::mutex> lock(impl_->events_mutex);

    EventRecord record;
    record.type = type;
    record.timestamp = std::chrono::system_clock::now();
    record.message = message;

    if (impl_->sink != nullptr && enabled(type)) {
        *impl_->sink << format_line(record, impl_->config.color) << '\n';
    }

    impl_->events.push_back(std::move(record));

    // Ограничиваем размер истории
    while (impl_->events.size() > impl_->config.event_history) {
        impl_->events.pop_front();
    }
}

void EventLog::log_genesis(std::string_view hash) {
    log_event(EventType::GENESIS, std::format("Генезис-блок создан: {}", hash));
}

void EventLog::log_block_mined(uint64_t index, uint64_t nonce, std::string_view hash, uint64_t attempts) {
    log_event(EventType::BLOCK_MINED,
              std::format("Блок #{} найден: nonce={} hash={} ({} попыток)",
                          index, nonce, hash, attempts));
}

void EventLog::log_block_rejected(const Error& error) {
    log_event(EventType::BLOCK_REJECTED,
              std::format("Блок отклонён [{}]: {}", static_cast<int>(error.code), error.message));
}

void EventLog::log_spend_failed(std::string_view txid, uint32_t output_index) {
    log_event(EventType::SPEND_FAILED,
              std::format("Выход {}:{} отсутствует или уже потрачен", txid, output_index));
}

void EventLog::log_faucet(std::string_view txid, uint64_t value) {
    log_event(EventType::FAUCET, std::format("Faucet выход {}:0 на {}", txid, value));
}

void EventLog::log_import(bool success, const std::string& message) {
    log_event(success ? EventType::IMPORT_OK : EventType::IMPORT_FAIL, message);
}

void EventLog::log_error(const std::string& message) {
    log_event(EventType::ERROR, message);
}

std::vector<EventRecord> EventLog::events() const {
    std::lock_guard<std::mutex> lock(impl_->events_mutex);
    return {impl_->events.begin(), impl_->events.end()};
}

std::size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(impl_->events_mutex);
    return impl_->events.size();
}

std::string EventLog::render_plain(std::size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->events_mutex);

    std::ostringstream out;
    if (impl_->events.empty()) {
        out << "  (no events)\n";
        return out.str();
    }

    std::size_t start = impl_->events.size() > count ? impl_->events.size() - count : 0;
    for (std::size_t i = start; i < impl_->events.size(); ++i) {
        const auto& event = impl_->events[i];
        out << "  " << std::format("{:%H:%M:%S}",
                                   std::chrono::floor<std::chrono::seconds>(event.timestamp))
            << " " << format_line(event, false) << "\n";
    }
    return out.str();
}

} // namespace powledger::log
