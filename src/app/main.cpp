/**
 * @file main.cpp
 * @brief codebox command-line entry point.
 *
 * Wires Config -> Logger -> DockerEngine -> Orchestrator and runs one
 * command:
 *   ping                  check the container engine
 *   runtimes [--all]      list runtimes (only those with a local image unless --all)
 *   execute <file|->      run one Piston-style JSON request, print the result
 *   batch <file>...       run several requests concurrently, one result per line
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "engine/docker_engine.hpp"
#include "orchestrator/orchestrator.hpp"
#include "orchestrator/request_codec.hpp"
#include "telemetry/json_sink.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace codebox;

namespace {

constexpr const char* kDefaultConfigPath = "config/default.toml";

enum ExitCode : int {
    kExitOk = 0,
    kExitFailure = 1,
    kExitUsage = 2
};

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::string log_dir;
    std::string command;
    std::vector<std::string> operands;
    bool all = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: codebox [OPTIONS] <command> [ARGS]\n"
        << "  --config <path>    Configuration file (default: " << kDefaultConfigPath << ")\n"
        << "  --log-dir <path>   Write NDJSON logs here instead of stderr\n"
        << "  --help, -h         Show this help message\n"
        << "\n"
        << "Commands:\n"
        << "  ping               Check that the container engine answers\n"
        << "  runtimes [--all]   List runtimes whose image is present (--all: every runtime)\n"
        << "  execute <file|->   Run one JSON request and print the result\n"
        << "  batch <file>...    Run several JSON requests concurrently\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--all") {
            args.all = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            std::exit(kExitOk);
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.operands.push_back(arg);
        }
    }
    if (args.command.empty()) return std::nullopt;
    return args;
}

Result<std::string> read_input(const std::string& source) {
    std::ostringstream buffer;
    if (source == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open request file: " + source};
    }
    buffer << in.rdbuf();
    return buffer.str();
}

Result<Config> resolve_config(const CLIArgs& args) {
    auto path = args.config_path.value_or(kDefaultConfigPath);
    auto loaded = load_config(path);

    Config config;
    if (loaded) {
        config = std::move(*loaded);
    } else if (loaded.error().code == ErrorCode::NotFound && !args.config_path) {
        config = default_config();
    } else {
        return loaded.error();
    }

    if (auto env = apply_env_overrides(config); !env) return env.error();
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    return config;
}

int report_error(const Error& error) {
    std::cout << RequestCodec::encode_error(error) << std::endl;
    const bool caller_fault = error.code == ErrorCode::InvalidRequest
                           || error.code == ErrorCode::NotFound;
    return caller_fault ? kExitUsage : kExitFailure;
}

int run_execute(Orchestrator& orchestrator, const std::string& source) {
    auto body = read_input(source);
    if (!body) return report_error(body.error());

    auto request = RequestCodec::decode_request(*body);
    if (!request) return report_error(request.error());

    auto result = orchestrator.execute(*request);
    if (!result) return report_error(result.error());

    std::cout << RequestCodec::encode_result(*result) << std::endl;
    return kExitOk;
}

int run_batch(Orchestrator& orchestrator, const std::vector<std::string>& sources) {
    std::vector<std::future<Result<ExecutionResult>>> pending;
    std::vector<std::optional<Error>> early(sources.size());

    for (size_t i = 0; i < sources.size(); ++i) {
        auto body = read_input(sources[i]);
        if (!body) {
            early[i] = body.error();
            pending.emplace_back();
            continue;
        }
        auto request = RequestCodec::decode_request(*body);
        if (!request) {
            early[i] = request.error();
            pending.emplace_back();
            continue;
        }
        pending.push_back(orchestrator.submit(std::move(*request)));
    }

    int status = kExitOk;
    for (size_t i = 0; i < pending.size(); ++i) {
        if (early[i]) {
            std::cout << RequestCodec::encode_error(*early[i]) << '\n';
            status = kExitFailure;
            continue;
        }
        auto result = pending[i].get();
        if (result) {
            std::cout << RequestCodec::encode_result(*result) << '\n';
        } else {
            std::cout << RequestCodec::encode_error(result.error()) << '\n';
            status = kExitFailure;
        }
    }
    std::cout.flush();
    return status;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage(std::cerr);
        return kExitUsage;
    }

    auto config = resolve_config(*args);
    if (!config) {
        std::cerr << "Failed to load config: " << config.error().message << std::endl;
        return kExitUsage;
    }

    // ── Logger ───────────────────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    const auto& telemetry = config->telemetry;
    if (!telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(telemetry.log_dir, "codebox",
                                                  telemetry.max_file_size_mb, telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(telemetry.log_dir, "metrics",
                                                      telemetry.max_file_size_mb, telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StderrSink>();
        metrics_sink = std::make_unique<NullSink>();
    }
    const auto level = parse_log_level(telemetry.log_level).value_or(LogLevel::Info);

    // ── Engine ───────────────────────────────
    auto engine = DockerEngine::from_config(config->engine);
    if (!engine) {
        std::cerr << "Invalid engine endpoint: " << engine.error().message << std::endl;
        return kExitUsage;
    }

    auto orchestrator = Orchestrator::create(Orchestrator::Options{
        .config = *config,
        .engine = std::move(*engine),
        .log_sink = std::move(log_sink),
        .metrics_sink = std::move(metrics_sink),
        .log_level = level,
    });
    if (!orchestrator) {
        std::cerr << "Invalid configuration: " << orchestrator.error().message << std::endl;
        return kExitUsage;
    }
    auto& orch = **orchestrator;

    // ── Commands ─────────────────────────────
    if (args->command == "ping") {
        if (auto ok = orch.ping(); !ok) return report_error(ok.error());
        std::cout << "ok" << std::endl;
        return kExitOk;
    }

    if (args->command == "runtimes") {
        auto runtimes = orch.list_runtimes(!args->all);
        if (!runtimes) return report_error(runtimes.error());
        std::cout << RequestCodec::encode_runtimes(*runtimes) << std::endl;
        return kExitOk;
    }

    if (args->command == "execute" || args->command == "batch") {
        if (args->operands.empty()
            || (args->command == "execute" && args->operands.size() != 1)) {
            print_usage(std::cerr);
            return kExitUsage;
        }
        if (auto started = orch.start(); !started) return report_error(started.error());

        return args->command == "execute"
            ? run_execute(orch, args->operands.front())
            : run_batch(orch, args->operands);
    }

    std::cerr << "Unknown command: " << args->command << "\n";
    print_usage(std::cerr);
    return kExitUsage;
}
