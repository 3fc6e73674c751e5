/**
 * Config Loader Tests
 *
 * YAML subset parsing, list forms, bad-line recovery and the mapping to
 * solver options.
 */

#include "../src/core/yaml_config.hpp"
#include <iostream>
#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cryptex;

void test_defaults() {
    AppConfig config;
    SolverOptions options = config.solver_options();
    assert(options.feasibility_threshold == 20);
    assert(options.success_threshold == 15);
    assert(options.xor_key == "KEY");
    assert(!options.seed);
    assert(options.strict_tokens);
    assert(!config.dictionary_candidates);
    assert(config.validate().empty());

    std::cout << "[PASS] Defaults\n";
}

void test_sections() {
    std::istringstream in(
        "# cryptex configuration\n"
        "---\n"
        "solver:\n"
        "  feasibility_threshold: 24\n"
        "  success_threshold: 18   # inline comment\n"
        "  xor_key: \"K#Y\"\n"
        "  seed: 2015\n"
        "  strict_tokens: no\n"
        "\n"
        "simulation:\n"
        "  latency_min_ms: 0\n"
        "  latency_max_ms: 10\n"
        "\n"
        "settings:\n"
        "  verbose: true\n"
        "  debug: off\n"
        "\n"
        "paths:\n"
        "  log_dir: '/tmp/cryptex logs'\n"
        "  progress_file: /tmp/progress.state\n");

    AppConfig config;
    assert(config.load_from_stream(in) == 0);

    assert(config.feasibility_threshold == 24);
    assert(config.success_threshold == 18);
    assert(config.xor_key == "K#Y");
    assert(config.seed == 2015);
    assert(!config.strict_tokens);
    assert(config.latency_min_ms == 0);
    assert(config.latency_max_ms == 10);
    assert(config.verbose);
    assert(!config.debug);
    assert(config.log_dir == "/tmp/cryptex logs");
    assert(config.progress_file == "/tmp/progress.state");

    SolverOptions options = config.solver_options();
    assert(options.feasibility_threshold == 24);
    assert(options.success_threshold == 18);
    assert(options.seed && *options.seed == 2015);
    assert(!options.strict_tokens);

    std::cout << "[PASS] Sections\n";
}

void test_flow_list() {
    std::istringstream in(
        "dictionary:\n"
        "  candidates: [\"\", foo, 'bar, baz', satoshi]\n");

    AppConfig config;
    assert(config.load_from_stream(in) == 0);
    assert(config.dictionary_candidates);
    const auto& list = *config.dictionary_candidates;
    assert(list.size() == 4);
    assert(list[0].empty());
    assert(list[1] == "foo");
    assert(list[2] == "bar, baz");
    assert(list[3] == "satoshi");

    std::istringstream empty_in("dictionary:\n  candidates: []\n");
    AppConfig empty;
    assert(empty.load_from_stream(empty_in) == 0);
    assert(empty.dictionary_candidates && empty.dictionary_candidates->empty());

    std::cout << "[PASS] Flow list\n";
}

void test_block_list() {
    std::istringstream in(
        "dictionary:\n"
        "  candidates:\n"
        "    - alpha\n"
        "    - \"hello world\"\n"
        "    - beta  # trailing comment\n"
        "settings:\n"
        "  verbose: yes\n");

    AppConfig config;
    assert(config.load_from_stream(in) == 0);
    assert(config.dictionary_candidates);
    assert(*config.dictionary_candidates == (std::vector<std::string>{"alpha", "hello world", "beta"}));
    assert(config.verbose);

    std::cout << "[PASS] Block list\n";
}

void test_bad_lines_are_skipped() {
    std::istringstream in(
        "solver:\n"
        "  this line has no separator\n"
        "  seed: -5\n"
        "  strict_tokens: maybe\n"
        "  feasibility_threshold: 12abc\n"
        "  success_threshold: 10\n"
        "  unknown_key: ignored\n"
        "dictionary:\n"
        "  candidates: [a, b\n");

    AppConfig config;
    assert(config.load_from_stream(in) == 5);

    // Good lines around the bad ones still apply
    assert(config.success_threshold == 10);
    assert(config.seed == 0);
    assert(config.strict_tokens);
    assert(config.feasibility_threshold == 20);
    assert(!config.dictionary_candidates);

    std::cout << "[PASS] Bad lines are skipped\n";
}

void test_unsigned_parsing() {
    assert(AppConfig::parse_u32("0") == 0);
    assert(AppConfig::parse_u32("4294967295") == 4294967295u);
    assert(AppConfig::parse_u64("18446744073709551615") == 18446744073709551615ULL);

    // Widths that do not fit are rejected instead of wrapping
    bool threw = false;
    try {
        AppConfig::parse_u32("4294967297");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    const char* rejected[] = {"-1", "+5", " -5", "", "12abc", "0x10"};
    for (const char* value : rejected) {
        threw = false;
        try {
            AppConfig::parse_u64(value);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[PASS] Unsigned parsing\n";
}

void test_validate() {
    AppConfig config;
    config.xor_key = "";
    config.success_threshold = 30;
    config.latency_min_ms = 100;
    config.latency_max_ms = 50;

    auto problems = config.validate();
    assert(problems.size() == 3);
    assert(problems[0].find("xor_key") != std::string::npos);
    assert(problems[1].find("success_threshold") != std::string::npos);
    assert(problems[2].find("latency") != std::string::npos);

    std::cout << "[PASS] Validate\n";
}

void test_apply_to_args() {
    struct Args {
        std::optional<uint64_t> seed;
        bool verbose = false;
        bool debug = false;
        std::string progress_file;
    };

    AppConfig config;
    config.seed = 7;
    config.debug = true;
    config.progress_file = "/tmp/from-config.state";

    Args args;
    apply_config_to_args(args, config);
    assert(args.seed && *args.seed == 7);
    assert(args.debug);
    assert(!args.verbose);
    assert(args.progress_file == "/tmp/from-config.state");

    // Command line wins
    Args explicit_args;
    explicit_args.seed = 99;
    explicit_args.progress_file = "/tmp/cli.state";
    apply_config_to_args(explicit_args, config);
    assert(*explicit_args.seed == 99);
    assert(explicit_args.progress_file == "/tmp/cli.state");

    std::cout << "[PASS] Apply to args\n";
}

int main() {
    std::cout << "=== Config Tests ===\n\n";

    test_defaults();
    test_sections();
    test_flow_list();
    test_block_list();
    test_bad_lines_are_skipped();
    test_unsigned_parsing();
    test_validate();
    test_apply_to_args();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
