/// @file main.cpp
/// @brief manifold runtime entry point - loads a manifest and runs it to completion
///
/// Flow:
/// - Optional runtime.toml ([runtime], [limits], [logging], [env]); flags override it
/// - Kernel boot (load, resolve, register, discover)
/// - Optional snapshot after boot
/// - Run, wait for holds to drain (or SIGINT/SIGTERM), stop

#include <manifold/core/error.hpp>
#include <manifold/core/log.hpp>
#include <manifold/kernel/kernel.hpp>
#include <manifold/manifest/loader.hpp>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace {

constexpr const char* k_version = "0.1.0";

// =============================================================================
// Runtime Configuration
// =============================================================================

struct RuntimeOptions {
    manifold_kernel::KernelConfig kernel;
    std::string manifest;
    std::string snapshot;
    std::string log_level = "info";
    std::string log_directory;
};

manifold_core::Result<void> load_config_file(const fs::path& path, RuntimeOptions& options) {
    toml::table tbl;
    try {
        tbl = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        return manifold_core::Err(manifold_core::Error(manifold_core::ErrorCode::InvalidArgument,
            "Failed to parse config " + path.string() + ": " + std::string(err.description())));
    }

    auto& kernel = options.kernel;

    // [runtime]
    if (auto runtime = tbl["runtime"].as_table()) {
        kernel.name = (*runtime)["name"].value_or(kernel.name);
        kernel.module_name = (*runtime)["module"].value_or(kernel.module_name);
        kernel.event_stream_path = (*runtime)["event_stream"].value_or(kernel.event_stream_path);
        options.manifest = (*runtime)["manifest"].value_or(options.manifest);
        options.snapshot = (*runtime)["snapshot"].value_or(options.snapshot);
    }

    // [limits]
    if (auto limits = tbl["limits"].as_table()) {
        kernel.max_discovery_passes = (*limits)["discovery_passes"].value_or(kernel.max_discovery_passes);
        kernel.max_resolution_passes = (*limits)["resolution_passes"].value_or(kernel.max_resolution_passes);
        kernel.max_expansion_depth = (*limits)["expansion_depth"].value_or(kernel.max_expansion_depth);
        kernel.max_expansion_passes = (*limits)["expansion_passes"].value_or(kernel.max_expansion_passes);
    }

    // [logging]
    if (auto logging = tbl["logging"].as_table()) {
        options.log_level = (*logging)["level"].value_or(options.log_level);
        options.log_directory = (*logging)["directory"].value_or(options.log_directory);
    }

    // [env] allow = ["NAME", ...] extends the default allowlist
    if (auto env = tbl["env"].as_table()) {
        if (auto allow = (*env)["allow"].as_array()) {
            for (const auto& entry : *allow) {
                if (auto name = entry.value<std::string>()) {
                    kernel.env_allowlist.push_back(*name);
                }
            }
        }
    }

    return manifold_core::Ok();
}

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] <MANIFEST>\n"
              << "\n"
              << "Arguments:\n"
              << "  MANIFEST                 Manifest file or directory (${VAR} is expanded)\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>          Runtime configuration (TOML)\n"
              << "  --log-level <level>      trace, debug, info, warn, error, critical, off\n"
              << "  --event-stream <file>    Append every event to a JSON-lines file\n"
              << "  --snapshot <file>        Write a snapshot after boot\n"
              << "  --module <name>          Module name for Self. kinds\n"
              << "  --help, -h               Show this help message\n"
              << "  --version, -v            Show version information\n";
}

void print_version() {
    std::cout << "manifold " << k_version << "\n";
}

// =============================================================================
// Signals
// =============================================================================

/// Waits for SIGINT/SIGTERM on a dedicated thread and releases idle waiters
class SignalWatcher {
public:
    explicit SignalWatcher(manifold_kernel::Kernel& kernel) : m_kernel(kernel) {
        sigemptyset(&m_signals);
        sigaddset(&m_signals, SIGINT);
        sigaddset(&m_signals, SIGTERM);
        sigaddset(&m_signals, SIGUSR1);
        m_thread = std::thread([this] { watch(); });
    }

    ~SignalWatcher() {
        m_finished = true;
        pthread_kill(m_thread.native_handle(), SIGUSR1);
        m_thread.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /// Must run before any other thread starts so every thread inherits the mask
    static void block_signals() {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        sigaddset(&signals, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    }

private:
    void watch() {
        while (!m_finished) {
            int signal = 0;
            if (sigwait(&m_signals, &signal) != 0) {
                return;
            }
            if (signal == SIGINT || signal == SIGTERM) {
                manifold_core::kernel_logger()->info("Received signal {}, shutting down", signal);
                m_kernel.shutdown();
            }
        }
    }

    manifold_kernel::Kernel& m_kernel;
    sigset_t m_signals;
    std::atomic<bool> m_finished{false};
    std::thread m_thread;
};

int fail(const manifold_core::Error& error) {
    spdlog::error("{}", manifold_core::build_error_chain(error));
    manifold_core::flush_all_loggers();
    return 1;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    RuntimeOptions options;
    std::optional<std::string> config_path;
    std::optional<std::string> cli_log_level;
    std::optional<std::string> cli_event_stream;
    std::optional<std::string> cli_snapshot;
    std::optional<std::string> cli_module;
    std::optional<std::string> cli_manifest;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&](std::optional<std::string>& out) -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        } else if (arg == "--config") {
            if (!next(config_path)) return 1;
        } else if (arg == "--log-level") {
            if (!next(cli_log_level)) return 1;
        } else if (arg == "--event-stream") {
            if (!next(cli_event_stream)) return 1;
        } else if (arg == "--snapshot") {
            if (!next(cli_snapshot)) return 1;
        } else if (arg == "--module") {
            if (!next(cli_module)) return 1;
        } else if (!arg.empty() && arg[0] != '-') {
            cli_manifest = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    manifold_core::init_logging();

    if (config_path) {
        auto loaded = load_config_file(*config_path, options);
        if (!loaded) {
            return fail(loaded.error());
        }
    }

    // Flags override the config file
    if (cli_log_level) options.log_level = *cli_log_level;
    if (cli_event_stream) options.kernel.event_stream_path = *cli_event_stream;
    if (cli_snapshot) options.snapshot = *cli_snapshot;
    if (cli_module) options.kernel.module_name = *cli_module;
    if (cli_manifest) options.manifest = *cli_manifest;

    manifold_core::LogConfig log_config;
    auto level = manifold_core::parse_log_level(options.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << options.log_level << "\n";
        return 1;
    }
    log_config.level = *level;
    if (!options.log_directory.empty()) {
        log_config.file_enabled = true;
        log_config.log_directory = options.log_directory;
    }
    manifold_core::configure_logging(log_config);

    if (options.manifest.empty()) {
        std::cerr << "Error: No manifest specified.\n\n";
        print_usage(argv[0]);
        return 1;
    }

    auto manifest = manifold_manifest::Loader::expand_env_path(options.manifest);
    if (!manifest) {
        return fail(manifest.error());
    }

    SignalWatcher::block_signals();

    manifold_kernel::Kernel kernel(options.kernel);
    spdlog::info("Loading manifest: {}", *manifest);

    auto loaded = kernel.load(*manifest);
    if (!loaded) {
        return fail(loaded.error());
    }

    int exit_code = 0;
    {
        SignalWatcher watcher(kernel);

        manifold_core::Result<void> outcome = kernel.boot();
        if (outcome && !options.snapshot.empty()) {
            outcome = kernel.save_snapshot(options.snapshot);
        }
        if (outcome) {
            outcome = kernel.run();
        }
        if (outcome) {
            kernel.wait_for_idle().wait();
        }

        auto stopped = kernel.stop();
        if (!outcome) {
            return fail(outcome.error());
        }
        if (!stopped) {
            return fail(stopped.error());
        }
        exit_code = kernel.exit_code();
    }

    auto stats = kernel.stats();
    spdlog::info("Stopped: {} resource(s), {} event(s), {} execution(s)",
                 stats.total_resources, stats.events_emitted, stats.executions);
    manifold_core::shutdown_logging();
    return exit_code;
}
