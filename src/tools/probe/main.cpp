/// @file main.cpp
/// @brief lra_probe entry point.
///
/// Drives a simulated flaky inference backend through a ResilienceStack and
/// prints each outcome, the component counters and the health snapshot.

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "lra/agent/resilience_stack.hpp"
#include "lra/foundation/config_manager.hpp"
#include "lra/resilience/failure.hpp"
#include "lra/resilience/resilience_config.hpp"
#include "lra/version.hpp"

namespace {

struct ProbeOptions {
    std::filesystem::path configPath;
    uint32_t requests = 20;
    double failureRate = 0.3;
    uint32_t distinctPrompts = 5;
    uint64_t seed = 42;
};

void printUsage(std::string_view program) {
    std::cerr << "usage: " << program
              << " [--config FILE] [--requests N] [--failure-rate P]"
                 " [--prompts N] [--seed S]\n";
}

std::optional<ProbeOptions> parseArgs(int argc, char* argv[]) {
    ProbeOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        }
        if (i + 1 >= argc) {
            std::cerr << "missing value for " << arg << "\n";
            return std::nullopt;
        }
        std::string value(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        try {
            if (arg == "--config") {
                opts.configPath = value;
            } else if (arg == "--requests") {
                opts.requests = static_cast<uint32_t>(std::stoul(value));
            } else if (arg == "--failure-rate") {
                opts.failureRate = std::stod(value);
            } else if (arg == "--prompts") {
                opts.distinctPrompts = static_cast<uint32_t>(std::stoul(value));
            } else if (arg == "--seed") {
                opts.seed = std::stoull(value);
            } else {
                std::cerr << "unknown option " << arg << "\n";
                return std::nullopt;
            }
        } catch (const std::exception&) {
            std::cerr << "invalid value for " << arg << ": " << value << "\n";
            return std::nullopt;
        }
    }
    if (opts.failureRate < 0.0 || opts.failureRate > 1.0 || opts.distinctPrompts == 0) {
        std::cerr << "--failure-rate must be in [0, 1] and --prompts positive\n";
        return std::nullopt;
    }
    return opts;
}

/// Backend that fails a configurable share of calls with a mix of
/// transient and permanent errors.
class FlakyBackend {
public:
    FlakyBackend(double failureRate, uint64_t seed)
        : failureRate_(failureRate), rng_(seed) {}

    lra::foundation::AgentResult<std::string> chat(std::string_view prompt) {
        using lra::foundation::AgentError;
        using lra::foundation::ErrorCode;
        using R = lra::foundation::AgentResult<std::string>;

        ++calls_;
        if (unit_(rng_) < failureRate_) {
            switch (pick_(rng_)) {
                case 0: return R::err(AgentError(ErrorCode::ConnectionRefused, "connection refused"));
                case 1: return R::err(AgentError(ErrorCode::Timeout, "read timed out"));
                case 2: return R::err(lra::foundation::upstreamHttpError(503));
                default: return R::err(AgentError(ErrorCode::ModelNotFound, "model not found"));
            }
        }
        return R::ok("echo: " + std::string(prompt));
    }

    [[nodiscard]] uint64_t calls() const noexcept { return calls_; }

private:
    double failureRate_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
    std::uniform_int_distribution<int> pick_{0, 9};
    uint64_t calls_ = 0;
};

lra::foundation::AgentResult<lra::resilience::ResilienceConfig> loadSettings(
    const ProbeOptions& opts) {
    lra::foundation::ConfigManager config;

    std::filesystem::path path = opts.configPath;
    const char* envPath = std::getenv("LRA_CONFIG_PATH");
    if (path.empty() && envPath != nullptr) {
        path = envPath;
    }

    if (!path.empty()) {
        if (auto loaded = config.load(path); !loaded) {
            return lra::foundation::AgentResult<lra::resilience::ResilienceConfig>::err(
                std::move(loaded).error());
        }
    }
    return lra::resilience::loadResilienceConfig(config);
}

} // namespace

int main(int argc, char* argv[]) {
    auto opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return EXIT_FAILURE;
    }

    auto settings = loadSettings(*opts);
    if (!settings) {
        std::cerr << "Failed to load config: " << settings.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto stack = lra::agent::ResilienceStack::create(settings.value());
    if (!stack) {
        std::cerr << "Invalid resilience settings: " << stack.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto& guard = stack.value()->inference();

    std::cout << lra::Version::product << "_probe " << lra::Version::string
              << " (requests: " << opts->requests
              << ", failure_rate: " << opts->failureRate
              << ", seed: " << opts->seed << ")\n";

    FlakyBackend backend(opts->failureRate, opts->seed);
    for (uint32_t i = 0; i < opts->requests; ++i) {
        std::string prompt = "prompt-" + std::to_string(i % opts->distinctPrompts);
        auto reply = guard.complete(prompt, [&] { return backend.chat(prompt); });

        std::cout << "#" << i << " " << prompt << ": ";
        if (reply) {
            std::cout << "ok \"" << reply.value() << "\"\n";
        } else {
            std::cout << lra::resilience::toString(
                             lra::resilience::classifyFailure(reply.error()))
                      << " (" << reply.error().message() << ") -> "
                      << lra::agent::GuardedInference::describe(reply.error()) << "\n";
        }
    }

    std::cout << "\nbackend calls: " << backend.calls() << "\n"
              << stack.value()->statsReport()
              << "health: " << lra::agent::healthToJson(guard.healthSnapshot()) << "\n";
    return EXIT_SUCCESS;
}
