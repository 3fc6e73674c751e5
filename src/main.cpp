/**
 * cryptex - Cryptographic Puzzle Solver
 *
 * Solves the built-in practice puzzles (ciphers, number sequences, hash
 * preimages and small Bitcoin-style keyspaces) or an ad-hoc challenge.
 *
 * Usage:
 *   cryptex --list
 *   cryptex --solve <id>
 *
 * Options:
 *   --list            List catalog puzzles with solved status
 *   --solve, -s       Solve one catalog puzzle
 *   --solve-all       Solve every unsolved, feasible puzzle and print a report
 *   --export <id>     Print a puzzle's public fields as JSON
 *   --category        Ad-hoc solve: category tag (with --challenge)
 *   --verbose, -v     Verbose output
 *   --help, -h        Show this help message
 *
 * Example:
 *   cryptex --solve 10
 *   cryptex --category cipher-decode --challenge "SGVsbG8="
 */

#include <iostream>
#include <string>
#include <vector>
#include <chrono>
#include <csignal>
#include <atomic>
#include <iomanip>
#include <optional>
#include <random>
#include <set>
#include <algorithm>

#include "core/types.hpp"
#include "core/logger.hpp"
#include "core/yaml_config.hpp"
#include "core/puzzle_catalog.hpp"
#include "core/puzzle_utils.hpp"
#include "core/progress_store.hpp"
#include "solver/puzzle_solver.hpp"
#include "solver/dictionary_search.hpp"

using namespace cryptex;

static std::atomic<bool> g_shutdown{false};

void signal_handler(int signum) {
    std::cout << "\n[!] Interrupt received, shutting down...\n";
    LOG_INFO("Signal received: " + std::to_string(signum));
    g_shutdown = true;
}

/**
 * Command-line arguments.
 */
struct Arguments {
    bool help = false;
    bool verbose = false;
    bool debug = false;

    // Catalog commands
    bool list = false;
    int solve_id = 0;                     // 0 = none
    bool solve_all = false;
    bool stats = false;
    bool recommend = false;
    int hints_id = 0;                     // 0 = none
    int export_id = 0;                    // 0 = none
    bool reset = false;

    // Ad-hoc solve
    std::string category;
    std::optional<std::string> challenge;
    std::optional<uint32_t> bits;
    std::optional<std::string> known;

    // Tuning
    bool no_delay = false;                // Skip simulated latency
    std::optional<uint64_t> seed;         // Reproducible attempt counters
    std::string progress_file;            // Default: ~/.cryptex/progress.state

    // Config file
    std::string config_file;              // Custom config file path (default: ./config.yml)

    bool parse_error = false;
};

/**
 * Parse command-line arguments.
 */
Arguments parse_args(int argc, char* argv[]) {
    Arguments args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
            } else if (arg == "--verbose" || arg == "-v") {
                args.verbose = true;
            } else if (arg == "--debug") {
                args.debug = true;
            } else if (arg == "--list" || arg == "-l") {
                args.list = true;
            } else if ((arg == "--solve" || arg == "-s") && i + 1 < argc) {
                args.solve_id = std::stoi(argv[++i]);
            } else if (arg == "--solve-all") {
                args.solve_all = true;
            } else if (arg == "--stats") {
                args.stats = true;
            } else if (arg == "--recommend") {
                args.recommend = true;
            } else if (arg == "--hints" && i + 1 < argc) {
                args.hints_id = std::stoi(argv[++i]);
            } else if (arg == "--export" && i + 1 < argc) {
                args.export_id = std::stoi(argv[++i]);
            } else if (arg == "--reset") {
                args.reset = true;
            } else if (arg == "--category" && i + 1 < argc) {
                args.category = argv[++i];
            } else if (arg == "--challenge" && i + 1 < argc) {
                args.challenge = argv[++i];
            } else if (arg == "--bits" && i + 1 < argc) {
                args.bits = AppConfig::parse_u32(argv[++i]);
            } else if (arg == "--known" && i + 1 < argc) {
                args.known = argv[++i];
            } else if (arg == "--no-delay") {
                args.no_delay = true;
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = AppConfig::parse_u64(argv[++i]);
            } else if (arg == "--progress-file" && i + 1 < argc) {
                args.progress_file = argv[++i];
            } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
                args.config_file = argv[++i];
            } else {
                std::cerr << "[!] Unknown or incomplete option: " << arg << "\n";
                args.parse_error = true;
            }
        } catch (const std::exception& e) {
            std::cerr << "[!] Invalid value for " << arg << ": " << e.what() << "\n";
            args.parse_error = true;
        }
    }

    return args;
}

/**
 * Print usage information.
 */
void print_usage() {
    std::cout << "\n";
    std::cout << "cryptex - Cryptographic Puzzle Solver\n";
    std::cout << "=====================================\n\n";

    std::cout << "Usage:\n";
    std::cout << "  cryptex --list\n";
    std::cout << "  cryptex --solve <id>\n\n";

    std::cout << R"(Catalog:
  --list, -l              List puzzles with solved status
  --solve, -s <id>        Solve one puzzle
  --solve-all             Solve all unsolved, feasible puzzles and print a report
  --stats                 Catalog statistics
  --recommend             Suggest the next puzzle to try
  --hints <id>            Show hints for a puzzle
  --export <id>           Print a puzzle's public fields as JSON
  --reset                 Forget all solved puzzles

Ad-hoc Solve:
  --category <tag>        bitcoin-address, hash-preimage, cipher-decode,
                          pattern-analysis, private-key-recovery
  --challenge <text>      Challenge payload
  --bits <n>              Keyspace width (keyspace categories)
  --known <text>          Reference answer, if known

Tuning:
  --no-delay              Skip the simulated processing delay
  --seed <n>              Reproducible attempt counters
  --progress-file <path>  Progress file (default: ~/.cryptex/progress.state)

Other:
  --help, -h              Show this help message
  --verbose, -v           Verbose output
  --debug                 Debug logging
  --config, -c <file>     Config file (default: ./config.yml)

Examples:
)";

    std::cout << R"(  cryptex --solve 9
  cryptex --solve-all --no-delay --seed 42
  cryptex --category pattern-analysis --challenge "1, 1, 2, 3, 5, 8"
)";
}

// =============================================================================
// OUTPUT
// =============================================================================

void print_outcome(const SolveOutcome& outcome, bool verbose) {
    if (outcome.succeeded()) {
        std::cout << "[+] SOLVED\n";
        std::cout << "    Solution: \"" << *outcome.solution() << "\"\n";
    } else {
        std::cout << "[-] NOT SOLVED\n";
    }
    std::cout << "    Method:   " << outcome.strategy_name() << "\n";
    std::cout << "    Attempts: " << outcome.attempts().to_grouped_decimal() << "\n";
    std::cout << "    Time:     " << std::fixed << std::setprecision(3) << outcome.elapsed_ms() << " ms\n";
    if (outcome.error() && verbose) {
        std::cout << "    Error:    " << to_string(*outcome.error()) << "\n";
    }
}

void print_puzzle_list(const PuzzleCatalog& catalog, const ProgressState& progress) {
    std::cout << "\n  ID  Status    Difficulty  Category              Name\n";
    std::cout << "  --  --------  ----------  --------------------  ----------------------------\n";
    for (const auto& entry : catalog.all()) {
        std::cout << "  " << std::setw(2) << entry.id << "  "
                  << std::left << std::setw(8) << (progress.is_solved(entry.id) ? "solved" : "-") << "  "
                  << std::setw(10) << to_string(entry.difficulty) << "  "
                  << std::setw(20) << to_string(entry.category) << "  "
                  << entry.name << std::right << "\n";
    }
    std::cout << "\n";
}

void print_statistics(const PuzzleStatistics& stats) {
    std::cout << "\nPuzzle Statistics\n";
    std::cout << "=================\n";
    std::cout << "Total:    " << stats.total << "\n";
    std::cout << "Solved:   " << stats.solved << "\n";
    std::cout << "Unsolved: " << stats.unsolved << "\n\n";
    std::cout << "By Category:\n";
    for (const auto& [category, count] : stats.by_category) {
        std::cout << "  " << std::left << std::setw(22) << to_string(category) << std::right << count << "\n";
    }
    std::cout << "\nBy Difficulty:\n";
    for (const auto& [difficulty, count] : stats.by_difficulty) {
        std::cout << "  " << std::left << std::setw(22) << to_string(difficulty) << std::right << count << "\n";
    }
    std::cout << "\n";
}

void print_puzzle_header(const PuzzleEntry& entry) {
    std::cout << "\n[*] Puzzle #" << entry.id << ": " << entry.name << "\n";
    std::cout << "    " << entry.description << "\n";
    std::cout << "    Difficulty: " << to_string(entry.difficulty)
              << " (" << difficulty_description(entry.difficulty) << ")\n";
    std::cout << "    Approach:   " << solver::PuzzleSolver::strategy_description(entry.category) << "\n";
    std::cout << "    Challenge:  " << entry.challenge << "\n";
    if (entry.bits) {
        std::cout << "    Keyspace:   2^" << *entry.bits << " = "
                  << format_large_number(expected_attempts(*entry.bits)) << " keys\n";
    }
}

// =============================================================================
// SOLVING
// =============================================================================

std::chrono::milliseconds pick_latency(const AppConfig& config, const Arguments& args, std::mt19937_64& rng) {
    if (args.no_delay) return std::chrono::milliseconds(0);
    uint32_t lo = std::min(config.latency_min_ms, config.latency_max_ms);
    uint32_t hi = std::max(config.latency_min_ms, config.latency_max_ms);
    std::uniform_int_distribution<uint32_t> dist(lo, hi);
    return std::chrono::milliseconds(dist(rng));
}

SolveOutcome run_solve(const solver::PuzzleSolver& solver, const PuzzleDescriptor& descriptor,
                       std::chrono::milliseconds latency) {
    if (latency.count() > 0) {
        std::cout << "[*] Analyzing..." << std::flush;
    }
    auto future = solver.solve_async(descriptor, latency);
    SolveOutcome outcome = future.get();
    if (latency.count() > 0) {
        std::cout << "\n";
    }
    return outcome;
}

int solve_catalog_puzzle(const solver::PuzzleSolver& solver, const PuzzleCatalog& catalog,
                         const ProgressStore& store, const AppConfig& config,
                         const Arguments& args, std::mt19937_64& rng) {
    const PuzzleEntry* entry = catalog.find(args.solve_id);
    if (!entry) {
        std::cerr << "[!] No puzzle with id " << args.solve_id << "\n";
        return 1;
    }

    print_puzzle_header(*entry);

    if (!is_solvable_with_current_tech(*entry)) {
        std::cout << "[-] Refusing to start: estimated solve time is "
                  << estimate_solve_time(*entry) << "\n";
        LOG_INFO("Puzzle " + std::to_string(entry->id) + " refused as infeasible");
        return 1;
    }

    SolveOutcome outcome = run_solve(solver, entry->descriptor(), pick_latency(config, args, rng));
    print_outcome(outcome, args.verbose);

    if (outcome.succeeded()) {
        if (entry->solution && !validate_solution(*entry, *outcome.solution())) {
            std::cout << "[!] Found answer does not match the recorded solution \""
                      << *entry->solution << "\"\n";
            return 0;
        }
        if (!store.record(entry->id, *outcome.solution())) {
            std::cerr << "[!] Could not save progress to " << store.path() << "\n";
        }
    }
    return 0;
}

int solve_all(const solver::PuzzleSolver& solver, const PuzzleCatalog& catalog,
              const ProgressStore& store, const AppConfig& config,
              const Arguments& args, std::mt19937_64& rng) {
    ProgressState progress = store.load();
    std::vector<PuzzleResult> results;

    for (const auto& entry : catalog.all()) {
        if (g_shutdown) break;
        if (progress.is_solved(entry.id) || !is_solvable_with_current_tech(entry)) continue;

        std::cout << "\n[*] #" << entry.id << " " << entry.name << "\n";
        SolveOutcome outcome = run_solve(solver, entry.descriptor(), pick_latency(config, args, rng));
        print_outcome(outcome, args.verbose);

        bool accepted = outcome.succeeded() &&
                        (!entry.solution || validate_solution(entry, *outcome.solution()));

        PuzzleResult result;
        result.puzzle_id = entry.id;
        result.solved = accepted;
        result.solution = outcome.solution();
        result.attempts = outcome.attempts();
        result.time_ms = outcome.elapsed_ms();
        result.timestamp = std::chrono::system_clock::now();
        results.push_back(result);

        if (accepted) {
            progress.solutions[entry.id] = *outcome.solution();
        }
    }

    if (!results.empty() && !store.save(progress)) {
        std::cerr << "[!] Could not save progress to " << store.path() << "\n";
    }

    std::cout << "\n" << generate_solving_report(results, catalog) << "\n";
    return 0;
}

int solve_adhoc(const solver::PuzzleSolver& solver, const Arguments& args) {
    if (!args.challenge) {
        std::cerr << "[!] --category requires --challenge\n";
        return 1;
    }

    PuzzleDescriptor descriptor{args.category, *args.challenge, args.bits, args.known};
    SolveOutcome outcome = solver.solve(descriptor);
    print_outcome(outcome, args.verbose);
    return outcome.succeeded() ? 0 : 2;
}

int main(int argc, char* argv[]) {
    Arguments args = parse_args(argc, argv);
    if (args.parse_error) {
        print_usage();
        return 1;
    }

    // Load config file (config.yml in current directory or ~/.cryptex/config.yml)
    // Command-line arguments take precedence over config file
    AppConfig app_config;
    if (app_config.load(args.config_file)) {
        apply_config_to_args(args, app_config);
    }

    if (args.help || argc == 1) {
        print_usage();
        return 0;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    auto& logger = Logger::instance();
    if (logger.init(app_config.log_dir, args.debug ? Logger::Level::DEBUG : Logger::Level::INFO)) {
        LOG_INFO("Starting cryptex v1.0.0");
        if (args.verbose) {
            std::cout << "[*] Logging to " << logger.get_log_path() << "\n";
        }
    } else if (args.verbose) {
        std::cerr << "[!] Logging disabled: could not open log directory\n";
    }

    for (const auto& problem : app_config.validate()) {
        std::cerr << "[!] Config: " << problem << "\n";
        LOG_WARN("Config: " + problem);
    }

    SolverOptions options = app_config.solver_options();
    if (args.seed) options.seed = args.seed;

    std::vector<std::string> candidates = app_config.dictionary_candidates
        ? *app_config.dictionary_candidates
        : solver::DictionarySearch::default_candidates();
    solver::PuzzleSolver solver(options, candidates);

    const PuzzleCatalog& catalog = PuzzleCatalog::builtin();
    ProgressStore store(args.progress_file);

    std::mt19937_64 rng(args.seed ? *args.seed : std::random_device{}());

    try {
        if (args.reset) {
            store.clear();
            std::cout << "[*] Progress cleared\n";
        }

        if (args.list) {
            print_puzzle_list(catalog, store.load());
        }

        if (args.stats) {
            print_statistics(compute_statistics(catalog, store.load().solved_ids()));
        }

        if (args.recommend) {
            const PuzzleEntry* next = recommend_next(catalog, store.load().solved_ids());
            if (next) {
                std::cout << "[*] Recommended: #" << next->id << " " << next->name
                          << " (" << to_string(next->difficulty) << ")\n";
            } else {
                std::cout << "[*] Nothing left to recommend - every feasible puzzle is solved\n";
            }
        }

        if (args.hints_id != 0) {
            const PuzzleEntry* entry = catalog.find(args.hints_id);
            if (!entry) {
                std::cerr << "[!] No puzzle with id " << args.hints_id << "\n";
                return 1;
            }
            std::cout << "[*] Hints for #" << entry->id << ":\n";
            std::cout << "    - " << entry->hint << "\n";
            for (const auto& hint : additional_hints(*entry)) {
                std::cout << "    - " << hint << "\n";
            }
            std::cout << "    Estimated solve time: " << estimate_solve_time(*entry) << "\n";
        }

        if (args.export_id != 0) {
            std::string json = export_puzzle_data(catalog, args.export_id);
            if (json.empty()) {
                std::cerr << "[!] No puzzle with id " << args.export_id << "\n";
                return 1;
            }
            std::cout << json << "\n";
        }

        if (args.solve_id != 0) {
            return solve_catalog_puzzle(solver, catalog, store, app_config, args, rng);
        }

        if (args.solve_all) {
            return solve_all(solver, catalog, store, app_config, args, rng);
        }

        if (!args.category.empty()) {
            return solve_adhoc(solver, args);
        }
    } catch (const std::exception& e) {
        std::cerr << "[!] Error: " << e.what() << "\n";
        logger.log_error(e.what());
        return 1;
    }

    return 0;
}
