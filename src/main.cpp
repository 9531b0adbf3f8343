/**
 * @file main.cpp
 * @brief Точка входа PoW Ledger
 *
 * PoW Ledger - демонстрационный леджер с proof-of-work.
 *
 * Основные компоненты:
 * 1. Ledger - цепочка блоков и множество выходов
 * 2. WorkloadGenerator - синтетические транзакции
 * 3. ChainValidator - проверка целостности
 * 4. chain_io - экспорт и импорт (JSON, TOML, текст)
 * 5. EventLog - журнал событий
 *
 * Использование:
 *   powledger [options] <command>
 *
 * Опции:
 *   -c, --config PATH       Путь к файлу конфигурации
 *   -d, --difficulty N      Переопределить сложность
 *   -h, --help              Показать справку
 *   -v, --version           Показать версию
 */

#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/hex.hpp"
#include "core/types.hpp"
#include "io/chain_io.hpp"
#include "io/json_codec.hpp"
#include "ledger/ledger.hpp"
#include "ledger/transaction.hpp"
#include "ledger/workload.hpp"
#include "log/event_log.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace powledger;
using json = nlohmann::json;

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Период опроса флага прерывания
constexpr auto INTERRUPT_POLL = std::chrono::milliseconds(20);

/// @brief Флаг прерывания, выставляется обработчиком сигналов
std::atomic<bool> g_interrupted{false};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

/**
 * @brief Отмена в пределах одной команды
 *
 * Фоновый поток переводит флаг прерывания в запрос остановки своего
 * stop_source. Прерывание, пришедшее до создания, не учитывается.
 */
class InterruptScope {
public:
    InterruptScope()
        : watcher_([this](std::stop_token done) {
              while (!done.stop_requested()) {
                  if (g_interrupted.exchange(false, std::memory_order_relaxed)) {
                      source_.request_stop();
                      return;
                  }
                  std::this_thread::sleep_for(INTERRUPT_POLL);
              }
          }) {}

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

    [[nodiscard]] std::stop_token token() const noexcept { return source_.get_token(); }

private:
    std::stop_source source_;
    std::jthread watcher_;
};

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
PoW Ledger v)" << VERSION << R"(
Демонстрационный леджер с proof-of-work

ИСПОЛЬЗОВАНИЕ:
    powledger [ОПЦИИ] <КОМАНДА>

ОПЦИИ:
    -c, --config PATH       Путь к файлу конфигурации (powledger.toml)
    -d, --difficulty N      Сложность (ведущих нулей в hex хеше)
    -h, --help              Показать эту справку
    -v, --version           Показать версию программы

КОМАНДЫ:
    mine [N]                Добыть N раундов (по умолчанию 1)
    chain [N]               Вывести цепочку и вердикт (после N раундов)
    export <json|toml|txt> [N]
                            Экспортировать цепочку после N раундов
    validate <FILE>         Импортировать файл и проверить цепочку
    decode <HEX>            Разобрать закодированную транзакцию
    repl                    Интерактивный режим с одним леджером

ПРИМЕРЫ:
    powledger -d 4 mine 3
    powledger export toml 2 > chain.toml
    powledger validate chain.toml

)";
}

void print_repl_help() {
    std::cout << R"(Команды:
    mine [N]                    добыть N раундов
    chain                       цепочка и вердикт
    export <json|toml|txt>      вывести экспорт
    save <json|toml|txt> <FILE> сохранить экспорт в файл
    validate <FILE>             проверить файл цепочки
    decode <HEX>                разобрать транзакцию
    utxo                        непотраченные выходы
    history                     последние события
    help                        эта справка
    quit                        выход
)";
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    std::optional<std::string> difficulty;
    bool show_help = false;
    bool show_version = false;
    std::vector<std::string> command;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-d" || arg == "--difficulty") && i + 1 < argc) {
            args.difficulty = argv[++i];
        } else {
            args.command.emplace_back(arg);
        }
    }

    return args;
}

/**
 * @brief Разобрать необязательное количество раундов
 */
[[nodiscard]] Result<uint64_t> parse_count(const std::vector<std::string>& words, std::size_t pos) {
    if (pos >= words.size()) {
        return uint64_t{1};
    }
    auto value = io::parse_unsigned(words[pos]);
    if (!value || *value == 0) {
        return Err<uint64_t>(
            ErrorCode::MalformedInput,
            std::format("Количество раундов должно быть положительным числом: '{}'", words[pos])
        );
    }
    return *value;
}

[[nodiscard]] json summary_to_json(const ledger::TxSummary& summary) {
    json j{
        {"txid", summary.txid},
        {"note", summary.note},
        {"inputs", summary.inputs},
        {"outputs", summary.outputs}
    };
    if (summary.fee) {
        j["fee"] = *summary.fee;
    }
    return j;
}

[[nodiscard]] json chain_with_verdict(const ledger::Ledger& ledger) {
    return json{
        {"chain", ledger.chain()},
        {"verdict", ledger.validate()}
    };
}

// =============================================================================
// Сессия: один леджер на время работы программы
// =============================================================================

class Session {
public:
    Session(const Config& config, ledger::Ledger ledger, log::EventLog& events)
        : config_(config)
        , ledger_(std::move(ledger))
        , generator_(config.workload)
        , events_(events) {}

    /**
     * @brief Добыть count раундов
     *
     * @param print Печатать блок, транзакции и вердикт каждого раунда
     */
    [[nodiscard]] Result<void> mine(uint64_t count, bool print = true) {
        g_interrupted.store(false, std::memory_order_relaxed);
        InterruptScope interrupt;

        for (uint64_t i = 0; i < count; ++i) {
            auto result = ledger_.mine_round(generator_, interrupt.token());
            if (!result) {
                return std::unexpected(result.error());
            }
            if (!print) {
                continue;
            }

            json txs = json::array();
            for (const auto& summary : result->summaries) {
                txs.push_back(summary_to_json(summary));
            }
            json out{
                {"message", "Block mined"},
                {"block", result->block},
                {"transactions", txs},
                {"verdict", result->verdict}
            };
            std::cout << out.dump(2) << std::endl;
        }
        return {};
    }

    void print_chain() const {
        std::cout << chain_with_verdict(ledger_).dump(2) << std::endl;
    }

    [[nodiscard]] Result<void> export_to(std::string_view format_name, std::ostream& out) const {
        auto format = io::parse_format(format_name);
        if (!format) {
            return Err<void>(
                ErrorCode::MalformedInput,
                std::format("Неизвестный формат '{}': ожидается json, toml или txt", format_name)
            );
        }
        out << io::export_chain(ledger_.chain(), *format);
        return {};
    }

    [[nodiscard]] Result<void> save(std::string_view format_name, const std::string& path) const {
        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Err<void>(
                ErrorCode::SystemIOError,
                std::format("Не удалось открыть файл для записи: {}", path)
            );
        }
        auto written = export_to(format_name, file);
        if (!written) {
            return written;
        }
        std::cout << "[INFO] Цепочка сохранена: " << path << std::endl;
        return {};
    }

    void print_utxo() const {
        const auto& utxo = ledger_.utxo();
        for (const auto& entry : utxo.list_available()) {
            std::cout << std::format("  {}:{}  {}  {}\n",
                                     entry.owning_txid, entry.output_index,
                                     entry.value, to_hex(entry.script));
        }
        std::cout << std::format("[INFO] Непотраченных: {} из {}, сумма {}",
                                 utxo.unspent_count(), utxo.entry_count(), utxo.unspent_value())
                  << std::endl;
    }

    void print_history() const {
        std::cout << events_.render_plain(config_.logging.event_history);
    }

    [[nodiscard]] const ledger::Ledger& ledger() const noexcept { return ledger_; }

private:
    const Config& config_;
    ledger::Ledger ledger_;
    ledger::WorkloadGenerator generator_;
    log::EventLog& events_;
};

// =============================================================================
// Команды без состояния
// =============================================================================

/**
 * @brief Проверить файл цепочки
 *
 * @return Result<bool> true если цепочка валидна
 */
[[nodiscard]] Result<bool> validate_file(const std::string& path, uint32_t difficulty, log::EventLog& events) {
    auto imported = io::import_file(path, difficulty);
    if (!imported) {
        events.log_import(false, std::format("{}: {}", path, imported.error().message));
        return std::unexpected(imported.error());
    }

    events.log_import(true, std::format("{}: {} блоков, формат {}",
                                        path, imported->blocks.size(), io::to_string(imported->format)));

    json out{
        {"difficulty", imported->difficulty},
        {"format", io::to_string(imported->format)},
        {"chain", imported->blocks},
        {"verdict", imported->verdict}
    };
    std::cout << out.dump(2) << std::endl;
    return imported->verdict.overall_valid;
}

[[nodiscard]] Result<void> decode_hex(const std::string& hex) {
    auto bytes = from_hex(hex);
    if (!bytes) {
        return Err<void>(ErrorCode::MalformedInput, "Транзакция должна быть hex строкой");
    }

    auto tx = ledger::decode_transaction(*bytes);
    if (!tx) {
        return std::unexpected(tx.error());
    }
    auto assigned = ledger::assign_txid(*tx);
    if (!assigned) {
        return assigned;
    }

    std::cout << json(*tx).dump(2) << std::endl;
    return {};
}

// =============================================================================
// Интерактивный режим
// =============================================================================

[[nodiscard]] std::vector<std::string> split_words(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(std::move(word));
    }
    return words;
}

void run_repl(Session& session, uint32_t difficulty, log::EventLog& events) {
    std::cout << std::format("[INFO] Леджер готов: сложность {}, блоков {}. help - список команд",
                             difficulty, session.ledger().chain().size())
              << std::endl;

    std::string line;
    while (true) {
        std::cout << "powledger> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        auto words = split_words(line);
        if (words.empty()) {
            continue;
        }
        const std::string& cmd = words[0];

        Result<void> status{};
        if (cmd == "quit" || cmd == "exit") {
            break;
        } else if (cmd == "help") {
            print_repl_help();
        } else if (cmd == "mine") {
            auto count = parse_count(words, 1);
            status = count ? session.mine(*count) : Result<void>(std::unexpected(count.error()));
        } else if (cmd == "chain") {
            session.print_chain();
        } else if (cmd == "export" && words.size() >= 2) {
            status = session.export_to(words[1], std::cout);
            std::cout << std::endl;
        } else if (cmd == "save" && words.size() >= 3) {
            status = session.save(words[1], words[2]);
        } else if (cmd == "validate" && words.size() >= 2) {
            auto valid = validate_file(words[1], difficulty, events);
            if (!valid) {
                status = std::unexpected(valid.error());
            }
        } else if (cmd == "decode" && words.size() >= 2) {
            status = decode_hex(words[1]);
        } else if (cmd == "utxo") {
            session.print_utxo();
        } else if (cmd == "history") {
            session.print_history();
        } else {
            std::cerr << "[ERROR] Неизвестная команда: " << line << " (help - список команд)" << std::endl;
        }

        if (!status) {
            std::cerr << "[ERROR] " << status.error().message << std::endl;
        }
    }
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    // Парсим аргументы
    auto args = parse_args(argc, argv);

    if (args.show_help || (args.command.empty() && !args.show_version)) {
        print_help();
        return args.show_help ? 0 : 1;
    }

    if (args.show_version) {
        std::cout << "PoW Ledger v" << VERSION << std::endl;
        return 0;
    }

    // Загружаем конфигурацию
    auto config_result = Config::load_with_search(args.config_path);
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }
    Config config = *config_result;

    if (args.difficulty) {
        auto difficulty = io::parse_unsigned(*args.difficulty);
        if (!difficulty) {
            std::cerr << "[ERROR] Сложность должна быть числом: " << *args.difficulty << std::endl;
            return 1;
        }
        if (*difficulty > constants::MAX_DIFFICULTY) {
            std::cerr << std::format("[ERROR] Сложность вне диапазона 1..{}: {}",
                                     constants::MAX_DIFFICULTY, *args.difficulty) << std::endl;
            return 1;
        }
        config.ledger.difficulty = static_cast<uint32_t>(*difficulty);
    }

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    log::EventLog events(config.logging, &std::cerr);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const auto& command = args.command;
    const std::string& name = command[0];
    const uint32_t difficulty = config.ledger.difficulty;

    // Команды, не требующие леджера
    if (name == "validate") {
        if (command.size() < 2) {
            std::cerr << "[ERROR] Использование: powledger validate <FILE>" << std::endl;
            return 1;
        }
        auto valid = validate_file(command[1], difficulty, events);
        if (!valid) {
            std::cerr << "[ERROR] " << valid.error().message << std::endl;
            return 1;
        }
        return *valid ? 0 : 2;
    }

    if (name == "decode") {
        if (command.size() < 2) {
            std::cerr << "[ERROR] Использование: powledger decode <HEX>" << std::endl;
            return 1;
        }
        auto decoded = decode_hex(command[1]);
        if (!decoded) {
            std::cerr << "[ERROR] " << decoded.error().message << std::endl;
            return 1;
        }
        return 0;
    }

    if (name != "mine" && name != "chain" && name != "export" && name != "repl") {
        std::cerr << "[ERROR] Неизвестная команда: " << name << std::endl;
        print_help();
        return 1;
    }

    if (name == "export" && (command.size() < 2 || !io::parse_format(command[1]))) {
        std::cerr << "[ERROR] Использование: powledger export <json|toml|txt> [N]" << std::endl;
        return 1;
    }

    // Создаём леджер (майнинг генезиса)
    auto created = [&] {
        InterruptScope interrupt;
        return ledger::Ledger::create(config.ledger, &events, interrupt.token());
    }();
    if (!created) {
        std::cerr << "[ERROR] " << created.error().message << std::endl;
        return 1;
    }

    Session session(config, std::move(*created), events);

    if (name == "repl") {
        run_repl(session, difficulty, events);
        return 0;
    }

    // export <fmt> [N]: количество раундов после формата
    std::size_t count_pos = name == "export" ? 2 : 1;
    uint64_t rounds = 0;
    if (name != "chain" || command.size() > 1) {
        auto count = parse_count(command, count_pos);
        if (!count) {
            std::cerr << "[ERROR] " << count.error().message << std::endl;
            return 1;
        }
        rounds = *count;
    }

    if (name == "mine") {
        auto mined = session.mine(rounds);
        if (!mined) {
            std::cerr << "[ERROR] " << mined.error().message << std::endl;
            return 1;
        }
        return 0;
    }

    // Для chain и export раунды майнятся без вывода сводок
    auto mined = session.mine(rounds, false);
    if (!mined) {
        std::cerr << "[ERROR] " << mined.error().message << std::endl;
        return 1;
    }

    if (name == "chain") {
        session.print_chain();
        return 0;
    }

    auto exported = session.export_to(command[1], std::cout);
    if (!exported) {
        std::cerr << "[ERROR] " << exported.error().message << std::endl;
        return 1;
    }
    std::cout << std::flush;
    return 0;
}
