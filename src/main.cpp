#include "config.h"
#include "device_catalog.h"
#include "fallback_client.h"
#include "interpretation_orchestrator.h"
#include "interpretation_worker_pool.h"
#include "logger.h"
#include "path_utils.h"
#include <signal.h>
#include <unistd.h>
#include <atomic>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace domo_nlu {

static std::atomic<bool> g_stop(false);
static std::atomic<bool> g_reload(false);

void signal_handler(int signal) {
    if (signal == SIGHUP) {
        g_reload = true;
    } else {
        g_stop = true;
    }
}

/// SIGINT/SIGTERM interrupt a blocking stdin read; SIGHUP lets it resume
void install_signal_handlers() {
    struct sigaction stop_action;
    std::memset(&stop_action, 0, sizeof(stop_action));
    stop_action.sa_handler = signal_handler;
    sigemptyset(&stop_action.sa_mask);
    sigaction(SIGINT, &stop_action, nullptr);
    sigaction(SIGTERM, &stop_action, nullptr);

    struct sigaction reload_action = stop_action;
    reload_action.sa_flags = SA_RESTART;
    sigaction(SIGHUP, &reload_action, nullptr);
}

struct CliOptions {
    std::string config_path;
    std::string devices_path;
    bool no_fallback = false;
    bool trace = false;
    bool check_fallback = false;
    std::vector<std::string> texts;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config PATH] [--devices PATH] [--no-fallback] [--trace] [--check-fallback] [text ...]\n"
              << "Interprets each text argument, or each stdin line when none are given,\n"
              << "and prints one JSON object per line.\n";
}

/// Returns false on a malformed command line
bool parse_arguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--devices") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a path\n";
                return false;
            }
            (arg == "--config" ? options.config_path : options.devices_path) = argv[++i];
        } else if (arg == "--no-fallback") {
            options.no_fallback = true;
        } else if (arg == "--trace") {
            options.trace = true;
        } else if (arg == "--check-fallback") {
            options.check_fallback = true;
        } else if (arg == "--") {
            for (++i; i < argc; ++i) options.texts.push_back(argv[i]);
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            options.texts.push_back(arg);
        }
    }
    return true;
}

/// config/config.json next to the executable (build/../config), else relative to cwd
std::string default_config_path() {
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
            std::ifstream test(candidate);
            if (test.good()) {
                return candidate;
            }
        }
    }
    return "config/config.json";
}

bool load_vocabulary(InterpretationOrchestrator& orchestrator, const std::string& path) {
    auto snapshot = load_device_snapshot(path);
    if (snapshot.is_error()) {
        LOG_ERROR("Cannot load devices from " + path + ": " + snapshot.error().message);
        return false;
    }
    auto reloaded = orchestrator.reload_vocabulary(snapshot.value());
    if (reloaded.is_error()) {
        LOG_ERROR("Device vocabulary rejected: " + reloaded.error().message);
        return false;
    }
    LOG_VOCAB("Loaded " + std::to_string(snapshot.value().size()) + " devices from " + path);
    return true;
}

void emit(InterpretationOrchestrator& orchestrator, InterpretationWorkerPool& pool,
          const std::string& text, bool trace, int wait_ms) {
    if (trace) {
        std::cout << trace_to_json(orchestrator.interpret_traced(text)) << std::endl;
        return;
    }
    auto result = pool.interpret_sync(text, wait_ms);
    if (result.is_error()) {
        LOG_WARN("Request \"" + text + "\" failed: " + result.error().message);
        Interpretation degraded;
        degraded.degraded = true;
        degraded.note = describe(result.error());
        std::cout << to_json(degraded) << std::endl;
        return;
    }
    std::cout << to_json(result.value()) << std::endl;
}

} // namespace domo_nlu

int main(int argc, char* argv[]) {
    using namespace domo_nlu;

    // Console logging goes to stderr; stdout carries one JSON line per request
    Logger::initialize(LogLevel::INFO, "", true);

    CliOptions options;
    if (!parse_arguments(argc, argv, options)) {
        print_usage(argv[0]);
        Logger::shutdown();
        return 2;
    }

    std::string config_path = options.config_path.empty() ? default_config_path() : options.config_path;
    Config config = Config::load_from_file(config_path);

    Logger::shutdown();
    Logger::initialize(Logger::parse_level(config.logging.level), expand_path(config.logging.file), true);

    if (options.no_fallback) {
        config.fallback.enabled = false;
    }
    std::string devices_path = options.devices_path.empty() ? config.vocabulary.devices_file
                                                            : expand_path(options.devices_path);

    std::shared_ptr<OllamaFallbackClient> fallback;
    if (config.fallback.enabled) {
        fallback = std::make_shared<OllamaFallbackClient>(config.fallback);
    }

    if (options.check_fallback) {
        if (!fallback) {
            std::cerr << "Fallback is disabled\n";
            Logger::shutdown();
            return 1;
        }
        auto status = fallback->check_connection();
        if (status.is_error()) {
            std::cerr << "Fallback unreachable at " << config.fallback.endpoint << ": "
                      << status.error().message << "\n";
            Logger::shutdown();
            return 1;
        }
        std::cout << "Fallback reachable at " << config.fallback.endpoint << std::endl;
        Logger::shutdown();
        return 0;
    }

    int exit_code = 0;
    {
        InterpretationOrchestrator orchestrator(config, fallback);
        load_vocabulary(orchestrator, devices_path);

        InterpretationWorkerPool pool(orchestrator, static_cast<size_t>(config.workers.count));
        // Generous bound on one request: the fallback wait plus connection setup
        int wait_ms = config.fallback.enabled
            ? config.fallback.timeout_ms + config.fallback.connect_timeout_ms + 1000
            : 0;

        install_signal_handlers();

        if (!options.texts.empty()) {
            for (const auto& text : options.texts) {
                if (g_stop) break;
                emit(orchestrator, pool, text, options.trace, wait_ms);
            }
        } else {
            std::string line;
            while (!g_stop && std::getline(std::cin, line)) {
                if (g_reload.exchange(false)) {
                    LOG_VOCAB("SIGHUP received, reloading " + devices_path);
                    load_vocabulary(orchestrator, devices_path);
                }
                if (line.empty()) {
                    continue;
                }
                emit(orchestrator, pool, line, options.trace, wait_ms);
            }
        }

        if (g_stop) {
            Logger::info("Shutting down...");
        }
        pool.shutdown();
        if (!pool.wait_for_completion(wait_ms)) {
            LOG_WARN("Requests still running at shutdown");
            exit_code = 1;
        }
    }

    Logger::shutdown();
    return exit_code;
}
