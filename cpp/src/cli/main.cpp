// =============================================================================
// babbler CLI - Markov sentence generator
// =============================================================================
//
// Usage:
//   babbler <command> [options] [keywords...]
//
// Commands:
//   generate    Build or load a chain and print the best of N sentences
//   export      Print the JSON snapshot of a chain built from a corpus
//   stats       Show chain statistics
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   babbler generate --corpus notes.txt -n 500 deer forest
//   babbler export --corpus notes.txt -o 3 > chain.json
//   babbler generate --snapshot chain.json -s 42 -v deer
//
// =============================================================================

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "babbler/cli/arguments.hpp"
#include "babbler/config.hpp"
#include "babbler/error.hpp"
#include "babbler/logging.hpp"
#include "babbler/generative/chain_model.hpp"
#include "babbler/generative/generation_config.hpp"
#include "babbler/generative/sentence_synthesizer.hpp"
#include "babbler/ingest/tokenizer.hpp"
#include "babbler/io/snapshot_json.hpp"

namespace babbler::cli {
    int cmd_generate(int argc, char* argv[]);
    int cmd_export(int argc, char* argv[]);
    int cmd_stats(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define BABBLER_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"generate", "Generate a sentence from a corpus or snapshot", babbler::cli::cmd_generate},
    {"export",   "Print the JSON snapshot of a chain", babbler::cli::cmd_export},
    {"stats",    "Show chain statistics", babbler::cli::cmd_stats},
    {"version",  "Show version information", babbler::cli::cmd_version},
    {"help",     "Show this help message", babbler::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Option Parsing
// =============================================================================

namespace babbler::cli {

struct CommandOptions {
    std::string corpus;
    std::string snapshot;
    std::string config_file;
    std::optional<int64_t> order;
    std::optional<size_t> length;
    std::optional<size_t> max_length;
    std::optional<double> alpha;
    std::optional<double> beta;
    std::optional<size_t> samples;
    std::optional<size_t> threads;
    std::optional<uint32_t> seed;
    bool verbose = false;
    std::vector<std::string> keywords;
};

static CommandOptions parse_options(int argc, char* argv[]) {
    CommandOptions opts;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            BABBLER_CHECK_ARGUMENT(i + 1 < argc, "missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--corpus") {
            opts.corpus = next();
        } else if (arg == "--snapshot") {
            opts.snapshot = next();
        } else if (arg == "-c" || arg == "--config") {
            opts.config_file = next();
        } else if (arg == "-o" || arg == "--order") {
            opts.order = static_cast<int64_t>(
                parse_count(arg, next(), std::numeric_limits<int64_t>::max()));
        } else if (arg == "-l" || arg == "--length") {
            opts.length = parse_count(arg, next(), std::numeric_limits<size_t>::max());
        } else if (arg == "-m" || arg == "--max-length") {
            opts.max_length = parse_count(arg, next(), std::numeric_limits<size_t>::max());
        } else if (arg == "-a" || arg == "--alpha") {
            opts.alpha = parse_real(arg, next());
        } else if (arg == "-b" || arg == "--beta") {
            opts.beta = parse_real(arg, next());
        } else if (arg == "-n" || arg == "--samples") {
            opts.samples = parse_count(arg, next(), std::numeric_limits<size_t>::max());
        } else if (arg == "-t" || arg == "--threads") {
            opts.threads = parse_count(arg, next(), std::numeric_limits<size_t>::max());
        } else if (arg == "-s" || arg == "--seed") {
            opts.seed = static_cast<uint32_t>(
                parse_count(arg, next(), std::numeric_limits<uint32_t>::max()));
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw InvalidArgumentError("unknown option: " + arg);
        } else {
            opts.keywords.push_back(arg);
        }
    }

    BABBLER_CHECK_ARGUMENT(opts.corpus.empty() != opts.snapshot.empty(),
                           "exactly one of --corpus or --snapshot is required");
    return opts;
}

// Config file and BB_* environment first, then command-line overrides
static generative::GenerationConfig resolve_config(const CommandOptions& opts) {
    if (!init_config(opts.config_file)) {
        throw InvalidArgumentError("invalid configuration", "resolve_config",
                                   "Check the BB_* environment variables and the config file");
    }
    if (opts.verbose && Logger::getInstance().level() > LogLevel::DEBUG) {
        set_log_level(LogLevel::DEBUG);
        Config::getInstance().print();
    }

    generative::GenerationConfig config = generative::load_generation_config();
    if (opts.order) config.order = *opts.order;
    if (opts.length) config.sentence_length = *opts.length;
    if (opts.max_length) config.max_length = *opts.max_length;
    if (opts.alpha) config.alpha = *opts.alpha;
    if (opts.beta) config.beta = *opts.beta;
    if (opts.samples) config.sample_count = *opts.samples;
    if (opts.threads) config.num_threads = *opts.threads;
    config.keywords = opts.keywords;
    return config;
}

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("cannot open file", path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Each non-empty line of the corpus is one ingestion unit
static generative::ChainModel load_model(const CommandOptions& opts, const generative::GenerationConfig& config) {
    if (!opts.snapshot.empty()) {
        auto model = generative::ChainModel::from_snapshot(io::parse_snapshot(read_file(opts.snapshot)));
        LOG_INFO("Loaded snapshot ", opts.snapshot, ": order ", model.order(), ", ", model.node_count(), " nodes");
        return model;
    }

    std::ifstream in(opts.corpus);
    if (!in.is_open()) {
        throw IOError("cannot open corpus", opts.corpus);
    }

    generative::ChainModel model(config.order);
    size_t units = 0;
    size_t tokens = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto words = ingest::tokenize(line);
        tokens += words.size();
        model.analyze(words);
        ++units;
    }

    LOG_INFO("Analyzed ", tokens, " tokens in ", units, " units from ", opts.corpus);
    return model;
}

// =============================================================================
// Commands
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "Babbler - keyword-biased Markov sentence generator\n";
    std::cout << "Version " << BABBLER_VERSION_STRING << "\n\n";
    std::cout << "Usage: babbler <command> [options] [keywords...]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nOptions:\n";
    std::cout << "  --corpus <file>         Text corpus, one ingestion unit per line\n";
    std::cout << "  --snapshot <file>       JSON chain snapshot\n";
    std::cout << "  -c, --config <file>     key=value configuration file\n";
    std::cout << "  -o, --order <k>         Chain order (default: 4)\n";
    std::cout << "  -l, --length <n>        Target sentence length in tokens (default: 50)\n";
    std::cout << "  -m, --max-length <n>    Hard length limit (default: 2 x length)\n";
    std::cout << "  -a, --alpha <x>         Rarity exponent (default: 2.0)\n";
    std::cout << "  -b, --beta <x>          Keyword exponent (default: 1.5)\n";
    std::cout << "  -n, --samples <n>       Attempts per sentence (default: 1000)\n";
    std::cout << "  -t, --threads <n>       Worker threads (default: 1)\n";
    std::cout << "  -s, --seed <n>          Random seed\n";
    std::cout << "  -v, --verbose           Debug logging and scores\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  BB_LOG_LEVEL, BB_LOG_FILE, BB_ORDER, BB_SENTENCE_LENGTH, BB_MAX_LENGTH,\n";
    std::cout << "  BB_ALPHA, BB_BETA, BB_SAMPLE_COUNT, BB_THREADS\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "Babbler " << BABBLER_VERSION_STRING << "\n";
    return 0;
}

int cmd_generate(int argc, char* argv[]) {
    try {
        CommandOptions opts = parse_options(argc, argv);
        generative::GenerationConfig config = resolve_config(opts);
        generative::ChainModel model = load_model(opts, config);

        generative::Rng rng(opts.seed ? *opts.seed : std::random_device{}());
        generative::SentenceSynthesizer synthesizer(model, config.num_threads);
        generative::GenerationResult result = synthesizer.generate(config, rng);

        if (result.text.empty()) {
            std::cerr << "No sentence reached a valid stop with a positive score\n";
            return 2;
        }

        std::cout << result.text << "\n";
        if (opts.verbose) {
            std::cout << "score: " << result.score << "\n";
        }
        return 0;
    } catch (const BabblerException& e) {
        LOG_ERROR(e.what());
        return 1;
    }
}

int cmd_export(int argc, char* argv[]) {
    try {
        CommandOptions opts = parse_options(argc, argv);
        generative::GenerationConfig config = resolve_config(opts);
        generative::ChainModel model = load_model(opts, config);

        std::cout << io::serialize_snapshot(model.to_snapshot()) << "\n";
        return 0;
    } catch (const BabblerException& e) {
        LOG_ERROR(e.what());
        return 1;
    }
}

int cmd_stats(int argc, char* argv[]) {
    try {
        CommandOptions opts = parse_options(argc, argv);
        generative::GenerationConfig config = resolve_config(opts);
        generative::ChainModel model = load_model(opts, config);

        std::cout << "Order: " << model.order() << "\n";
        std::cout << "Nodes: " << model.node_count() << "\n";
        std::cout << "Edges: " << model.edge_count() << "\n";
        return 0;
    } catch (const BabblerException& e) {
        LOG_ERROR(e.what());
        return 1;
    }
}

} // namespace babbler::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    ++argv;
    --argc;

    if (argc < 1) {
        babbler::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'babbler help' for usage.\n";
    return 1;
}
