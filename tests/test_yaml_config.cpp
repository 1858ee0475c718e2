/**
 * YAML Config Tests
 *
 * Parsing of seedhound.yml and merging with command line settings.
 */

#include "../src/core/yaml_config.hpp"
#include <cassert>
#include <iostream>
#include <sstream>

using namespace seedhound;

namespace {

// Mirrors the command line fields merged by apply_config_to_args()
struct Args {
    std::string mode, tokens_file, mnemonic, wordlist, wildcards_file;
    int max_typos = -1, max_swaps = -1, max_substitutions = -1, max_combined = -1;
    bool typo_case = false, typo_repeat = false, typo_delete = false, typo_transpose = false;
    std::string typo_replace, typo_insert, typos_map;
    int close_distance = -1;
    std::string oracle_type;
    std::vector<std::string> targets;
    std::string address_db;
    std::vector<std::string> paths;
    int address_limit = -1;
    std::string passphrase;
    std::string worker;
    int threads = -1, devices = -1;
    size_t batch_size = 0;
    std::string autosave_file;
    double autosave_interval_seconds = -1;
    unsigned long long autosave_interval_candidates = 0;
    bool verbose = false, debug = false;
    int performance_seconds = -1;
};

AppConfig parse(const std::string& text) {
    AppConfig config;
    std::istringstream in(text);
    config.load_stream(in, "test.yml");
    return config;
}

bool rejected(const std::string& text, const std::string& fragment) {
    try {
        parse(text);
    } catch (const ConfigurationError& e) {
        return std::string(e.what()).find(fragment) != std::string::npos;
    }
    return false;
}

}  // namespace

void test_full_file() {
    AppConfig c = parse(
        "---\n"
        "# recovery of an old wallet\n"
        "search:\n"
        "  mode: password\n"
        "  tokens: \"tokens.txt\"   # token list\n"
        "  max_typos: 2\n"
        "  max_swaps: 1\n"
        "\n"
        "typos:\n"
        "  case: true\n"
        "  delete: yes\n"
        "  replace: 'abc#1'\n"
        "\n"
        "oracle:\n"
        "  type: brainwallet\n"
        "  targets: [1JwSSubhmg6iPtRjtyqhUYYH7bZg3Lfy1T, \"1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH\"]\n"
        "  target: 1EHNa6Q4Jz2uvNExL497mE43ikXhwF6kZm\n"
        "  paths: [\"m/44'/0'/0'/0\"]\n"
        "  address_limit: 5\n"
        "\n"
        "workers:\n"
        "  worker: 2/4\n"
        "  threads: 8\n"
        "  batch_size: 1024\n"
        "\n"
        "autosave:\n"
        "  file: run.ckpt\n"
        "  interval_seconds: 30.5\n"
        "\n"
        "settings:\n"
        "  verbose: on\n");

    assert(c.mode == "password");
    assert(c.tokens_file == "tokens.txt");
    assert(c.max_typos == 2);
    assert(c.max_swaps == 1);
    assert(c.max_substitutions == -1);
    assert(c.typo_case && c.typo_delete && !c.typo_repeat);
    assert(c.typo_replace == "abc#1");
    assert(c.oracle_type == "brainwallet");
    assert(c.targets.size() == 3);
    assert(c.targets[1] == "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH");
    assert(c.targets[2] == "1EHNa6Q4Jz2uvNExL497mE43ikXhwF6kZm");
    assert(c.paths.size() == 1 && c.paths[0] == "m/44'/0'/0'/0");
    assert(c.address_limit == 5);
    assert(c.worker == "2/4");
    assert(c.threads == 8);
    assert(c.batch_size == 1024);
    assert(c.autosave_file == "run.ckpt");
    assert(c.autosave_interval_seconds == 30.5);
    assert(c.verbose && !c.debug);

    std::cout << "[PASS] Full configuration file\n";
}

void test_errors() {
    assert(rejected("search:\n  colour: blue\n", "test.yml:2"));
    assert(rejected("search:\n  colour: blue\n", "unknown key 'colour'"));
    assert(rejected("gpu:\n  device: 0\n", "unknown section 'gpu'"));
    assert(rejected("search:\n  max_typos: many\n", "invalid value 'many'"));
    assert(rejected("search:\n  max_typos: -1\n", "must not be negative"));
    assert(rejected("search:\n  just text\n", "expected 'key: value'"));

    AppConfig config;
    bool threw = false;
    try {
        config.load("/nonexistent/seedhound.yml");
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Configuration errors\n";
}

void test_command_line_wins() {
    AppConfig c = parse(
        "search:\n"
        "  mode: seed\n"
        "  max_typos: 1\n"
        "typos:\n"
        "  transpose: true\n"
        "oracle:\n"
        "  type: bip39\n"
        "  targets: [a, b]\n"
        "workers:\n"
        "  threads: 4\n");

    Args args;
    args.max_typos = 3;
    args.targets = {"cli"};
    args.threads = 2;
    apply_config_to_args(args, c);

    assert(args.mode == "seed");
    assert(args.max_typos == 3);
    assert(args.typo_transpose);
    assert(args.oracle_type == "bip39");
    assert(args.targets.size() == 1 && args.targets[0] == "cli");
    assert(args.threads == 2);
    assert(args.max_swaps == -1);

    std::cout << "[PASS] Command line overrides config\n";
}

int main() {
    std::cout << "=== YAML Config Tests ===\n\n";

    test_full_file();
    test_errors();
    test_command_line_wins();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
