// afbuild - builds a game source file into a WASM artifact.
//
// Usage:
//   afbuild --input <game.ts> [options]
//
// Options:
//   --input, -i <file>    Game source file.
//   --output, -o <file>   Output .wasm path (default: input with .wasm extension).
//   --game-type <type>    Game type used for the game id (default: input file stem).
//   --config <file.ini>   Load compiler/sandbox/logging settings.
//   --source-map          Also write <output>.map.
//   --no-strict           Do not fail on analyzer warnings.
//   --run <ticks>         Load the artifact in a sandbox and drive init + update.
//   --verbose, -v         Enable all log tags.
//   --quiet, -q           Disable logging.
//   --help, -h            Show this help message.

#include <builder/game_builder.hpp>
#include <core/config.hpp>
#include <core/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#ifndef ARENAFORGE_VERSION
#define ARENAFORGE_VERSION "0.0.0-dev"
#endif

namespace fs = std::filesystem;

namespace {

struct Options {
    fs::path inputFile;
    fs::path outputFile;
    fs::path configFile;
    std::string gameType;
    bool sourceMap{false};
    bool noStrict{false};
    int runTicks{0};
    bool verbose{false};
    bool quiet{false};
};

void print_usage(const char* program) {
    std::cerr << "afbuild v" << ARENAFORGE_VERSION << "\n"
              << "Usage: " << program << " --input <game.ts> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --input, -i <file>    Game source file.\n"
              << "  --output, -o <file>   Output .wasm path (default: input with .wasm extension).\n"
              << "  --game-type <type>    Game type used for the game id (default: input file stem).\n"
              << "  --config <file.ini>   Load compiler/sandbox/logging settings.\n"
              << "  --source-map          Also write <output>.map.\n"
              << "  --no-strict           Do not fail on analyzer warnings.\n"
              << "  --run <ticks>         Load the artifact in a sandbox and drive init + update.\n"
              << "  --verbose, -v         Enable all log tags.\n"
              << "  --quiet, -q           Disable logging.\n"
              << "  --help, -h            Show this help message.\n";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "--input" || arg == "-i") {
            if (++i >= argc) {
                std::cerr << "Error: --input requires a file path.\n";
                return false;
            }
            opts.inputFile = argv[i];
        } else if (arg == "--output" || arg == "-o") {
            if (++i >= argc) {
                std::cerr << "Error: --output requires a file path.\n";
                return false;
            }
            opts.outputFile = argv[i];
        } else if (arg == "--game-type") {
            if (++i >= argc) {
                std::cerr << "Error: --game-type requires a value.\n";
                return false;
            }
            opts.gameType = argv[i];
        } else if (arg == "--config") {
            if (++i >= argc) {
                std::cerr << "Error: --config requires a file path.\n";
                return false;
            }
            opts.configFile = argv[i];
        } else if (arg == "--source-map") {
            opts.sourceMap = true;
        } else if (arg == "--no-strict") {
            opts.noStrict = true;
        } else if (arg == "--run") {
            if (++i >= argc) {
                std::cerr << "Error: --run requires a tick count.\n";
                return false;
            }
            opts.runTicks = std::atoi(argv[i]);
            if (opts.runTicks < 0) {
                std::cerr << "Error: --run tick count must not be negative.\n";
                return false;
            }
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        }
    }

    if (opts.inputFile.empty()) {
        std::cerr << "Error: --input is required.\n";
        return false;
    }
    if (opts.outputFile.empty()) {
        opts.outputFile = opts.inputFile;
        opts.outputFile.replace_extension(".wasm");
    }
    if (opts.gameType.empty()) {
        opts.gameType = opts.inputFile.stem().string();
    }
    return true;
}

bool read_text(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

bool write_file(const fs::path& path, const void* data, std::size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    return static_cast<bool>(out);
}

bool write_text(const fs::path& path, const std::string& text) {
    return write_file(path, text.data(), text.size());
}

int run_ticks(server::builder::GameBuilder& builder, const std::vector<std::uint8_t>& bytes,
              const std::string& gameType, int ticks) {
    using namespace server::sandbox;

    try {
        GameInstance instance = builder.load_game(bytes, gameType);
        std::cout << "Loaded " << instance.id() << " (seed " << instance.seed() << ")\n";

        instance.call("init");

        int overruns = 0;
        for (int t = 0; t < ticks; ++t) {
            try {
                instance.call("update");
            } catch (const BudgetExceededError& e) {
                ++overruns;
                std::cerr << "Warning: tick " << t << ": " << e.what() << "\n";
            }
        }

        instance.destroy();
        std::cout << "Ran " << ticks << " ticks, " << overruns << " over budget\n";
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    server::core::Config config;
    if (!opts.configFile.empty() && !config.load_from_file(opts.configFile.string())) {
        std::cerr << "Error: cannot read config " << opts.configFile << "\n";
        return 1;
    }

    server::core::LogConfig logging = config.logging();
    if (opts.quiet) {
        logging.enabled = false;
    } else if (opts.verbose) {
        logging.enabled = true;
        logging.build = logging.analyze = logging.sandbox = logging.debug = true;
    }
    server::core::set_log_config(logging);

    server::builder::CompilerConfig compilerConfig = config.compiler();
    if (opts.sourceMap) compilerConfig.sourceMap = true;
    if (opts.noStrict) compilerConfig.strict = false;

    std::string source;
    if (!read_text(opts.inputFile, source)) {
        std::cerr << "Error: cannot read " << opts.inputFile << "\n";
        return 1;
    }

    server::builder::GameBuilder builder(compilerConfig, config.sandbox());

    const auto metrics = builder.compiler().analyze(source).metrics;
    std::cout << "Analyzed " << opts.inputFile.string() << ": "
              << metrics.lineCount << " lines, "
              << metrics.functionCount << " functions, "
              << metrics.classCount << " classes, "
              << "complexity " << metrics.complexity << ", "
              << "~" << metrics.estimatedMemory << " bytes\n";

    const server::builder::BuildResult result = builder.build(source, opts.gameType);

    for (const auto& w : result.warnings) {
        std::cerr << "Warning: " << w << "\n";
    }
    if (!result.success) {
        for (const auto& e : result.errors) {
            std::cerr << "Error: " << e << "\n";
        }
        return 1;
    }

    const auto& bytes = *result.wasmBytes;
    if (!write_file(opts.outputFile, bytes.data(), bytes.size())) {
        std::cerr << "Error: cannot write " << opts.outputFile << "\n";
        return 1;
    }

    fs::path hashFile = opts.outputFile;
    hashFile += ".sha256";
    if (!write_text(hashFile, *result.wasmHash + "  " + opts.outputFile.filename().string() + "\n")) {
        std::cerr << "Error: cannot write " << hashFile << "\n";
        return 1;
    }

    if (result.sourceMap) {
        fs::path mapFile = opts.outputFile;
        mapFile += ".map";
        if (!write_text(mapFile, *result.sourceMap)) {
            std::cerr << "Error: cannot write " << mapFile << "\n";
            return 1;
        }
    }

    std::cout << "Built " << *result.gameId << " -> " << opts.outputFile.string()
              << " (" << bytes.size() << " bytes, sha256 " << *result.wasmHash << ")\n";

    if (opts.runTicks > 0) {
        return run_ticks(builder, bytes, opts.gameType, opts.runTicks);
    }
    return 0;
}
