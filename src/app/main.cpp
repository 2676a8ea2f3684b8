/**
 * @file main.cpp
 * @brief statsd_emit: send one metric from the command line.
 *
 * Wires Config → Logger → Client → (one metric) → close. Handy for shell
 * scripts, cron jobs and for checking that a collector is reachable.
 */

#include "client/client.hpp"
#include "client/observer.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "telemetry/log_sinks.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using namespace statsd_emitter;

namespace {

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> address;
    std::optional<std::string> prefix;
    std::optional<std::string> log_level;
    double rate = 1.0;
    bool verbose = false;
    std::vector<std::string> positional;   ///< command, stat, [value]
};

void print_usage() {
    std::cout << "Usage: statsd_emit [OPTIONS] <command> <stat> [value]\n"
              << "\n"
              << "Commands:\n"
              << "  incr | decr               Counter +1 / -1\n"
              << "  count <n>                 Counter by n\n"
              << "  gauge <n>                 Absolute gauge\n"
              << "  gauge-inc <n>             Gauge +n\n"
              << "  gauge-dec <n>             Gauge -n\n"
              << "  timing <ms>               Timer in milliseconds\n"
              << "  unique <n>                Set member\n"
              << "  annotate <text>           Annotation\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>     TOML configuration file\n"
              << "  --address <h:p>     Collector address (default: 127.0.0.1:8125)\n"
              << "  --prefix <p>        Literal stat prefix, e.g. \"app.\"\n"
              << "  --rate <r>          Sample rate (default: 1)\n"
              << "  --log-level <lvl>   debug | info | warn | error\n"
              << "  --verbose, -v       Log every line sent\n"
              << "  --help, -h          Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--address" && i + 1 < argc) {
            args.address = argv[++i];
        } else if (arg == "--prefix" && i + 1 < argc) {
            args.prefix = argv[++i];
        } else if (arg == "--rate" && i + 1 < argc) {
            char* end = nullptr;
            args.rate = std::strtod(argv[++i], &end);
            if (end == nullptr || *end != '\0') {
                std::cerr << "Invalid --rate: " << argv[i] << "\n";
                return std::nullopt;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (arg.starts_with("--")) {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            args.positional.push_back(std::move(arg));
        }
    }
    return args;
}

std::optional<int64_t> parse_int(const std::string& text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

std::unique_ptr<ILogSink> make_log_sink(const LoggingConfig& cfg) {
    if (cfg.file.empty()) {
        return std::make_unique<StderrSink>();
    }
    auto sink = std::make_unique<FileSink>(cfg.file);
    if (!sink->is_open()) {
        std::cerr << "Cannot open log file " << cfg.file << ", logging to stderr\n";
        return std::make_unique<StderrSink>();
    }
    return sink;
}

/**
 * @brief Dispatch one command to the matching client operation.
 */
Result<void> emit(Client& client, const std::vector<std::string>& pos, double rate) {
    const std::string& command = pos[0];
    const std::string& stat = pos[1];

    if (command == "incr") return client.increment(stat, 1, rate);
    if (command == "decr") return client.decrement(stat, 1, rate);

    if (pos.size() < 3) {
        return Error{ErrorKind::Config, "Command '" + command + "' needs a value"};
    }
    if (command == "annotate") return client.annotate_text(stat, pos[2]);

    auto value = parse_int(pos[2]);
    if (!value) {
        return Error{ErrorKind::Config, "Value is not an integer: " + pos[2]};
    }

    if (command == "count")     return client.increment(stat, *value, rate);
    if (command == "gauge")     return client.gauge(stat, *value, rate);
    if (command == "gauge-inc") return client.increment_gauge(stat, *value, rate);
    if (command == "gauge-dec") return client.decrement_gauge(stat, *value, rate);
    if (command == "timing")    return client.timing(stat, *value, rate);
    if (command == "unique")    return client.unique(stat, *value, rate);

    return Error{ErrorKind::Config, "Unknown command: " + command};
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }
    if (args->positional.size() < 2) {
        print_usage();
        return 1;
    }

    // ── Configuration ────────────────────────
    Config config = default_config();
    if (args->config_path) {
        auto loaded = load_config(*args->config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message << "\n";
            return 1;
        }
        config = std::move(loaded).value();
    }

    if (args->address) config.client.address = *args->address;
    if (args->prefix) config.client.prefix = *args->prefix;
    if (args->verbose) {
        config.logging.trace_lines = true;
        config.logging.level = LogLevel::Debug;
    }
    if (args->log_level) {
        auto level = parse_log_level(*args->log_level);
        if (!level) {
            std::cerr << "Unknown log level: " << *args->log_level << "\n";
            return 1;
        }
        config.logging.level = *level;
    }

    // ── Logger ───────────────────────────────
    Logger logger(make_log_sink(config.logging), config.logging.level, "statsd_emit");

    // ── Client ───────────────────────────────
    auto client = Client::from_config(config.client);
    if (!client) {
        logger.error("Cannot reach collector " + config.client.address + ": "
                     + client.error().message);
        return 1;
    }
    if (config.logging.trace_lines) {
        (*client)->set_observer(std::make_unique<LoggingObserver>(logger));
    }

    auto sent = emit(**client, args->positional, args->rate);
    if (!sent) {
        logger.error("Send failed (" + std::string(to_string(sent.error().kind)) + "): "
                     + sent.error().message);
        return 1;
    }

    auto closed = (*client)->close();
    if (!closed) {
        logger.error("Close failed: " + closed.error().message);
        return 1;
    }

    logger.info("Sent " + args->positional[0] + " " + args->positional[1]
                + " to " + config.client.address);
    logger.flush();
    return 0;
}
