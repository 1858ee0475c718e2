/**
 * seedhound - Wallet Password and Seed Recovery
 *
 * Enumerates every candidate of a user-described search space (tokens,
 * wildcards, typos, swaps, missing seed words) and checks each against a
 * verification oracle until the password or mnemonic is found.
 *
 * Usage:
 *   seedhound password --tokens <file> --target <address> [options]
 *   seedhound seed --mnemonic "<words>" --wordlist <file> --target <address> [options]
 *
 * Options:
 *   --count          Print the number of candidates and exit
 *   --listpass       Print candidates instead of verifying them
 *   --worker i/M     Search only slice i of M (for several machines)
 *   --autosave FILE  Checkpoint progress; --restore resumes from it
 *   --performance    Measure candidates per second
 *   --help, -h       Show this help message
 *
 * Example:
 *   seedhound password --tokens tokens.txt --typos 1 --typos-case --target 1Abc...
 *   seedhound seed --mnemonic "abandon ? ability ..." --wordlist english.txt --address-db addr.db
 */

#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>

#include "core/errors.hpp"
#include "core/format.hpp"
#include "core/logger.hpp"
#include "core/thread_pool.hpp"
#include "core/types.hpp"
#include "core/yaml_config.hpp"
#include "generators/candidate_space.hpp"
#include "generators/mutation.hpp"
#include "generators/token_model.hpp"
#include "generators/wildcard.hpp"
#include "generators/wordlist.hpp"
#include "oracle/oracle.hpp"
#include "search/checkpoint.hpp"
#include "search/dispatcher.hpp"
#include "search/partition.hpp"

using namespace seedhound;

namespace {

// Exit codes
constexpr int EXIT_FOUND = 0;
constexpr int EXIT_NOT_FOUND = 1;
constexpr int EXIT_CONFIG = 2;
constexpr int EXIT_CHECKPOINT = 3;
constexpr int EXIT_ORACLE = 4;
constexpr int EXIT_INTERRUPTED = 130;

StopToken g_stop;
volatile std::sig_atomic_t g_interrupts = 0;

void signal_handler(int) {
    // Only async-signal-safe work here; drivers pause at the next batch
    g_interrupts = g_interrupts + 1;
    if (g_interrupts > 1) std::_Exit(EXIT_INTERRUPTED);
    g_stop.request(StopReason::INTERRUPTED);
}

/**
 * Command-line arguments. -1 / empty means "not given" so the config file
 * can fill it in.
 */
struct Arguments {
    std::string mode;                     // "password" or "seed"

    // Search description
    std::string tokens_file;
    std::string mnemonic;
    std::string wordlist;
    std::string wildcards_file;
    int max_typos = -1;
    int max_swaps = -1;
    int max_substitutions = -1;
    int max_combined = -1;

    // Typo families
    bool typo_case = false;
    bool typo_repeat = false;
    bool typo_delete = false;
    bool typo_transpose = false;
    std::string typo_replace;
    std::string typo_insert;
    std::string typos_map;
    int close_distance = -1;

    // Oracle
    std::string oracle_type;
    std::vector<std::string> targets;
    std::string address_db;
    std::vector<std::string> paths;
    int address_limit = -1;
    std::string passphrase;

    // Workers
    std::string worker;
    int threads = -1;
    int devices = -1;
    size_t batch_size = 0;

    // Autosave
    std::string autosave_file;
    double autosave_interval_seconds = -1;
    unsigned long long autosave_interval_candidates = 0;
    bool restore = false;

    // Modes
    bool count = false;
    bool listpass = false;
    bool performance = false;
    int performance_seconds = -1;

    // Config file
    std::string config_file;

    bool verbose = false;
    bool debug = false;
    bool help = false;
};

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used == value.size() && n >= 0) return n;
    } catch (const std::logic_error&) {
    }
    throw ConfigurationError(flag + " expects a non-negative integer, got '" + value + "'");
}

unsigned long long parse_ull(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        unsigned long long n = std::stoull(value, &used);
        if (used == value.size() && value[0] != '-') return n;
    } catch (const std::logic_error&) {
    }
    throw ConfigurationError(flag + " expects a non-negative integer, got '" + value + "'");
}

double parse_seconds(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        double d = std::stod(value, &used);
        if (used == value.size() && d >= 0) return d;
    } catch (const std::logic_error&) {
    }
    throw ConfigurationError(flag + " expects a number of seconds, got '" + value + "'");
}

/**
 * Parse command-line arguments.
 *
 * @throws ConfigurationError on unknown flags or missing values
 */
Arguments parse_args(int argc, char* argv[]) {
    Arguments args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigurationError(arg + " requires a value");
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "password" || arg == "seed") {
            if (!args.mode.empty()) throw ConfigurationError("mode given twice");
            args.mode = arg;
        } else if (arg == "--tokens" || arg == "-t") {
            args.tokens_file = value();
        } else if (arg == "--mnemonic" || arg == "-m") {
            args.mnemonic = value();
        } else if (arg == "--wordlist") {
            args.wordlist = value();
        } else if (arg == "--wildcards") {
            args.wildcards_file = value();
        } else if (arg == "--typos") {
            args.max_typos = parse_int(arg, value());
        } else if (arg == "--swaps") {
            args.max_swaps = parse_int(arg, value());
        } else if (arg == "--max-substitutions") {
            args.max_substitutions = parse_int(arg, value());
        } else if (arg == "--max-edits") {
            args.max_combined = parse_int(arg, value());
        } else if (arg == "--typos-case") {
            args.typo_case = true;
        } else if (arg == "--typos-repeat") {
            args.typo_repeat = true;
        } else if (arg == "--typos-delete") {
            args.typo_delete = true;
        } else if (arg == "--typos-transpose") {
            args.typo_transpose = true;
        } else if (arg == "--typos-replace") {
            args.typo_replace = value();
        } else if (arg == "--typos-insert") {
            args.typo_insert = value();
        } else if (arg == "--typos-map") {
            args.typos_map = value();
        } else if (arg == "--close-distance") {
            args.close_distance = parse_int(arg, value());
        } else if (arg == "--oracle") {
            args.oracle_type = value();
        } else if (arg == "--target") {
            args.targets.push_back(value());
        } else if (arg == "--address-db") {
            args.address_db = value();
        } else if (arg == "--path") {
            args.paths.push_back(value());
        } else if (arg == "--address-limit") {
            args.address_limit = parse_int(arg, value());
        } else if (arg == "--passphrase") {
            args.passphrase = value();
        } else if (arg == "--worker" || arg == "-w") {
            args.worker = value();
        } else if (arg == "--threads") {
            args.threads = parse_int(arg, value());
        } else if (arg == "--devices") {
            args.devices = parse_int(arg, value());
        } else if (arg == "--batch-size") {
            args.batch_size = static_cast<size_t>(parse_ull(arg, value()));
        } else if (arg == "--autosave") {
            args.autosave_file = value();
        } else if (arg == "--autosave-interval") {
            args.autosave_interval_seconds = parse_seconds(arg, value());
        } else if (arg == "--autosave-candidates") {
            args.autosave_interval_candidates = parse_ull(arg, value());
        } else if (arg == "--restore") {
            args.restore = true;
        } else if (arg == "--count") {
            args.count = true;
        } else if (arg == "--listpass") {
            args.listpass = true;
        } else if (arg == "--performance") {
            args.performance = true;
        } else if (arg == "--performance-time") {
            args.performance_seconds = parse_int(arg, value());
        } else if (arg == "--config" || arg == "-c") {
            args.config_file = value();
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--debug") {
            args.debug = true;
        } else {
            throw ConfigurationError("unknown argument '" + arg + "' (see --help)");
        }
    }

    return args;
}

/**
 * Print usage information.
 */
void print_usage() {
    std::cout << "\n";
    std::cout << "seedhound - wallet password and seed recovery\n";
    std::cout << "=============================================\n\n";

    std::cout << "Usage:\n";
    std::cout << "  seedhound password --tokens <file> [options]\n";
    std::cout << "  seedhound seed --mnemonic \"<words>\" --wordlist <file> [options]\n\n";

    std::cout << R"(Search Space:
  --tokens, -t <file>       Token list (password mode)
  --mnemonic, -m <words>    Remembered mnemonic, '?' for an unknown word (seed mode)
  --wordlist <file>         Mnemonic vocabulary, one word per line
  --wildcards <file>        Named lists for %{name} wildcards (name = path)
  --typos <n>               Maximum typos per candidate
  --swaps <n>               Maximum swapped token pairs
  --max-substitutions <n>   Maximum typos-map substitutions
  --max-edits <n>           Cap on typos + substitutions + swaps

Typo Families:
  --typos-case              Toggle the case of a letter
  --typos-repeat            Repeat a character
  --typos-delete            Delete a character
  --typos-transpose         Swap two adjacent characters
  --typos-replace <set>     Replace a character (a set or wildcard such as %a)
  --typos-insert <set>      Insert a character
  --typos-map <file>        Substitution map ("chars  replacements" per line)
  --close-distance <n>      Seed mode: replace only with words n edits away

Verification:
  --oracle <type>           sha256, brainwallet or bip39
                            (default: brainwallet for passwords, bip39 for seeds)
  --target <value>          Address, hash160 or SHA-256 digest (repeatable)
  --address-db <file>       Address database from seedhound-create-db
  --path <path>             BIP32 account path (repeatable, default BIP44/49/84)
  --address-limit <n>       Addresses checked per path (default: 1)
  --passphrase <text>       BIP39 passphrase

Workers:
  --threads <n>             Verification threads (default: all cores)
  --devices <n>             Driver threads per worker slice (default: 1)
  --batch-size <n>          Candidates per batch (default: 4096)
  --worker, -w <i/M>        Search only slice i of M (1-based, e.g. 2/4 or 1,3/4)

Checkpoints:
  --autosave <file>         Save progress to <file> (<file>.<n> per driver)
  --autosave-interval <s>   Seconds between saves (default: 300)
  --autosave-candidates <n> Also save after this many candidates
  --restore                 Resume from the autosave file

Other:
  --count                   Print the number of candidates and exit
  --listpass                Print candidates instead of verifying them
  --performance             Measure verification speed
  --performance-time <s>    Performance run duration (default: 30s)
  --config, -c <file>       Config file (default: ./seedhound.yml)
  --verbose, -v             Verbose output
  --debug                   Write debug entries to the log
  --help, -h                Show this help message

Exit Codes:
  0 found, 1 not found, 2 configuration error, 3 checkpoint mismatch,
  4 oracle error, 130 interrupted

Examples:
)";

    std::cout << R"(  seedhound password --tokens tokens.txt --typos 2 --typos-case --target 1Abc...
  seedhound seed -m "abandon ? ability able ..." --wordlist english.txt --address-db addr.db
  seedhound password --tokens tokens.txt --worker 2/4 --autosave run.ckpt
  seedhound password --tokens tokens.txt --listpass
)";
}

/**
 * Characters for a replace/insert family: either a literal set or a
 * wildcard such as %a whose expansions are single characters.
 */
std::string expand_charset(const std::string& flag, const std::string& value,
                           const NamedLists& lists) {
    if (!Wildcard::is_pattern(value)) return Wildcard::unescape_literal(value);

    Wildcard wildcard = Wildcard::compile(value, lists);
    if (wildcard.count() > 256) {
        throw ConfigurationError(flag + " '" + value + "' must expand to single characters");
    }
    std::string chars;
    for (Ordinal i = 0; i < wildcard.count(); ++i) {
        std::string one = wildcard.expand(i);
        if (one.size() != 1) {
            throw ConfigurationError(flag + " '" + value + "' must expand to single characters");
        }
        if (chars.find(one[0]) == std::string::npos) chars += one;
    }
    return chars;
}

TokenModel build_model(const Arguments& args, RecoveryMode mode, const NamedLists& lists,
                       std::shared_ptr<const Wordlist>& wordlist) {
    if (!args.wordlist.empty()) {
        wordlist = Wordlist::load(args.wordlist);
        std::cout << "[*] Wordlist: " << args.wordlist << " (" << wordlist->size() << " words)\n";
    }

    if (mode == RecoveryMode::SEED) {
        if (args.mnemonic.empty()) {
            throw ConfigurationError("seed mode needs --mnemonic");
        }
        if (!wordlist) {
            throw ConfigurationError("seed mode needs --wordlist");
        }
        return parse_mnemonic(args.mnemonic, wordlist);
    }

    if (args.tokens_file.empty()) {
        throw ConfigurationError("password mode needs --tokens");
    }
    return TokenListParser(lists).parse_file(args.tokens_file);
}

TypoOptions build_typos(const Arguments& args, const NamedLists& lists) {
    TypoOptions typos;
    typos.case_toggle = args.typo_case;
    typos.repeat = args.typo_repeat;
    typos.delete_char = args.typo_delete;
    typos.transpose = args.typo_transpose;
    if (!args.typo_replace.empty()) {
        typos.replace_set = expand_charset("--typos-replace", args.typo_replace, lists);
    }
    if (!args.typo_insert.empty()) {
        typos.insert_set = expand_charset("--typos-insert", args.typo_insert, lists);
    }
    if (!args.typos_map.empty()) {
        typos.typos_map = load_typos_map(args.typos_map);
    }
    if (args.close_distance > 0) typos.close_distance = static_cast<uint32_t>(args.close_distance);
    return typos;
}

MutationBudget build_budget(const Arguments& args, const TypoOptions& typos, RecoveryMode mode) {
    MutationBudget budget;
    budget.max_typos = args.max_typos > 0 ? args.max_typos : 0;
    budget.max_swaps = args.max_swaps > 0 ? args.max_swaps : 0;
    budget.max_substitutions = args.max_substitutions > 0 ? args.max_substitutions : 0;
    budget.max_combined = args.max_combined > 0 ? args.max_combined : 0;

    if (mode == RecoveryMode::PASSWORD) {
        if (budget.max_typos > 0 && !typos.any_typo()) {
            std::cout << "[!] --typos given but no typo family enabled (see --typos-case etc.)\n";
            LOG_WARN("typo budget without a typo family");
        }
        // A loaded map with no explicit budget allows one substitution
        if (!typos.typos_map.empty() && args.max_substitutions < 0) {
            budget.max_substitutions = 1;
        }
    }
    return budget;
}

void print_space(const CandidateSpace& space, bool verbose) {
    std::cout << "[*] Mode: " << mode_name(space.model().mode)
              << ", slots: " << space.slot_count() << "\n";
    std::cout << "[*] Candidates: " << space.cardinality().get_str() << "\n";
    std::cout << "[*] Fingerprint: " << space.fingerprint() << "\n";
    if (verbose) {
        for (const auto& c : space.classes()) {
            std::cout << "    swaps=" << c.swaps << " substitutions=" << c.substitutions
                      << " typos=" << c.typos << " -> " << c.count.get_str() << "\n";
        }
    }
}

OracleConfig build_oracle_config(const Arguments& args, RecoveryMode mode,
                                 std::shared_ptr<const Wordlist> wordlist) {
    OracleConfig config;
    if (!args.oracle_type.empty()) {
        config.type = args.oracle_type;
    } else {
        config.type = mode == RecoveryMode::SEED ? ORACLE_TYPE_BIP39 : ORACLE_TYPE_BRAINWALLET;
    }
    config.targets = args.targets;
    config.address_db_path = args.address_db;
    config.paths = args.paths;
    if (args.address_limit >= 0) config.address_limit = static_cast<uint32_t>(args.address_limit);
    config.passphrase = args.passphrase;
    config.wordlist = std::move(wordlist);
    if (args.performance) {
        // Nothing can match: every candidate is fully verified
        config.targets.clear();
        config.address_db_path.clear();
        config.allow_empty_targets = true;
    }
    return config;
}

int run_search(const Arguments& args) {
    RecoveryMode mode;
    if (args.mode == "password") {
        mode = RecoveryMode::PASSWORD;
    } else if (args.mode == "seed") {
        mode = RecoveryMode::SEED;
    } else if (args.mode.empty()) {
        throw ConfigurationError("no mode given: use 'seedhound password' or 'seedhound seed'");
    } else {
        throw ConfigurationError("unknown mode '" + args.mode + "'");
    }

    NamedLists lists;
    if (!args.wildcards_file.empty()) {
        lists = load_wildcard_definitions(args.wildcards_file);
    }

    std::shared_ptr<const Wordlist> wordlist;
    TokenModel model = build_model(args, mode, lists, wordlist);
    TypoOptions typos = build_typos(args, lists);
    MutationBudget budget = build_budget(args, typos, mode);

    CandidateSpace space(std::move(model), budget, typos);
    print_space(space, args.verbose || args.count);

    if (args.count) return EXIT_FOUND;

    WorkerSelector selector = args.worker.empty() ? WorkerSelector::single()
                                                  : WorkerSelector::parse(args.worker);
    uint32_t devices = args.devices > 0 ? static_cast<uint32_t>(args.devices) : 1;
    std::vector<WorkerRange> ranges =
        plan_ranges(space.cardinality(), space.fingerprint(), selector, devices);

    if (selector.count > 1) {
        std::cout << "[*] Worker " << selector.to_string() << "\n";
        std::cout << "[!] Other worker processes are not stopped when this one finds a match\n";
    }

    if (args.listpass) {
        Ordinal printed = list_candidates(space, ranges, std::cout, g_stop);
        std::cerr << "[*] Listed " << printed.get_str() << " candidates\n";
        return g_stop.reason() == StopReason::INTERRUPTED ? EXIT_INTERRUPTED : EXIT_FOUND;
    }

    OracleConfig oracle_config = build_oracle_config(args, mode, wordlist);
    auto pool = std::make_shared<ThreadPool>(args.threads > 0 ? static_cast<size_t>(args.threads) : 0);
    std::unique_ptr<VerificationOracle> oracle = create_oracle(oracle_config, pool);

    std::cout << "[*] Oracle: " << oracle->name() << ", threads: " << pool->size() << "\n";
    Logger::instance().log_startup(mode_name(mode), oracle->name(), space.cardinality().get_str(),
                                   space.fingerprint());

    size_t batch_size = args.batch_size > 0 ? args.batch_size : DispatchConfig().batch_size;

    if (args.performance) {
        double seconds = args.performance_seconds > 0 ? args.performance_seconds : 30;
        std::cout << "[*] Measuring performance for " << seconds << "s...\n";
        PerformanceResult perf = measure_performance(space, *oracle, g_stop, seconds, batch_size);
        std::cout << "[+] " << format_rate(perf.rate()) << " ("
                  << perf.tested << " in " << std::fixed << std::setprecision(1)
                  << perf.elapsed_seconds << "s)\n";
        if (perf.rate() > 0) {
            std::cout << "[*] Full space at this rate: "
                      << format_duration(space.cardinality().get_d() / perf.rate()) << "\n";
        }
        LOG_INFO("PERFORMANCE: Rate=" + format_rate(perf.rate()));
        return EXIT_FOUND;
    }

    DispatchConfig dispatch;
    dispatch.batch_size = batch_size;
    dispatch.autosave_path = args.autosave_file;
    dispatch.restore = args.restore;
    if (args.autosave_interval_seconds >= 0) dispatch.autosave_interval_seconds = args.autosave_interval_seconds;
    dispatch.autosave_interval_candidates = args.autosave_interval_candidates;

    if (args.restore && args.autosave_file.empty()) {
        throw ConfigurationError("--restore needs --autosave <file>");
    }
    if (!args.restore && !args.autosave_file.empty()) {
        for (const auto& range : ranges) {
            CheckpointManager existing(CheckpointManager::path_for(args.autosave_file, range.driver,
                                                                   range.driver_count));
            if (existing.exists()) {
                throw ConfigurationError("checkpoint " + existing.path() +
                                         " already exists; pass --restore or remove it");
            }
        }
    }

    Dispatcher dispatcher(space, *oracle, dispatch, g_stop);
    auto last_log = std::chrono::steady_clock::now();
    dispatcher.set_progress_callback([&](const ProgressSnapshot& p) {
        std::cout << "\r[*] Tested " << format_count(p.tested)
                  << " | " << format_rate(p.rate())
                  << " | " << std::fixed << std::setprecision(3) << p.percent() << "%"
                  << " | ETA " << format_duration(p.eta_seconds()) << "    " << std::flush;
        if (std::chrono::steady_clock::now() - last_log > std::chrono::seconds(60)) {
            Logger::instance().log_progress(std::to_string(p.tested), p.rate(), p.percent());
            last_log = std::chrono::steady_clock::now();
        }
    });

    RunOutcome outcome = dispatcher.run(std::move(ranges));
    std::cout << "\n";

    const char* what = mode == RecoveryMode::SEED ? "Seed" : "Password";
    switch (outcome.status) {
        case RunStatus::MATCH_FOUND:
            std::cout << "[+] " << what << " found: '" << outcome.match->text << "'\n";
            std::cout << "    " << outcome.match->identifier << " (candidate "
                      << outcome.match->ordinal.get_str() << ")\n";
            return EXIT_FOUND;
        case RunStatus::EXHAUSTED:
            std::cout << "[!] " << what << " not found in this search space"
                      << (selector.count > 1 ? " slice" : "") << "\n";
            return EXIT_NOT_FOUND;
        case RunStatus::INTERRUPTED:
            std::cout << "[*] Interrupted after " << outcome.tested << " candidates\n";
            if (!args.autosave_file.empty()) {
                std::cout << "[*] Resume with --autosave " << args.autosave_file << " --restore\n";
            }
            return EXIT_INTERRUPTED;
    }
    return EXIT_NOT_FOUND;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Arguments args = parse_args(argc, argv);
        if (args.help || argc < 2) {
            print_usage();
            return args.help ? EXIT_FOUND : EXIT_CONFIG;
        }

        AppConfig config;
        if (config.load(args.config_file)) {
            std::cout << "[*] Loaded config from: " << config.loaded_from << "\n";
        }
        apply_config_to_args(args, config);

        Logger::instance().init();
        if (args.debug) Logger::instance().set_min_level(Logger::Level::DEBUG);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        return run_search(args);
    } catch (const CheckpointMismatchError& e) {
        std::cerr << "\n[!] Checkpoint error: " << e.what() << "\n";
        Logger::instance().log_error(e.what());
        return EXIT_CHECKPOINT;
    } catch (const OracleError& e) {
        std::cerr << "\n[!] Verification failed: " << e.what() << "\n";
        Logger::instance().log_error(e.what());
        return EXIT_ORACLE;
    } catch (const Error& e) {
        // ConfigurationError, PartitionBoundsError
        std::cerr << "[!] " << e.what() << "\n";
        Logger::instance().log_error(e.what());
        return EXIT_CONFIG;
    } catch (const std::exception& e) {
        std::cerr << "\n[!] Fatal error: " << e.what() << "\n";
        Logger::instance().log_error(e.what());
        return EXIT_ORACLE;
    }
}
