#include "Config.hpp"
#include "EdgeSupervisor.hpp"
#include "Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>

static std::atomic<bool> running(true);
static std::atomic<bool> reloadRequested(false);

static void signalHandler(int sig) {
    if (sig == SIGHUP) reloadRequested = true;
    else running = false;
}

static void usage() {
    std::cerr << "usage: tdv_edge --config <file> [--log <file>]\n";
}

int main(int argc, char** argv) {
    std::string configPath;
    std::string logPath;
    for (int i = 1; i < argc; i++) {
        if (!strcmp(argv[i], "--config") && i + 1 < argc) configPath = argv[++i];
        else if (!strcmp(argv[i], "--log") && i + 1 < argc) logPath = argv[++i];
        else {
            usage();
            return 2;
        }
    }
    if (configPath.empty()) {
        if (const char* env = getenv("TDV_CONFIG")) configPath = env;
    }
    if (configPath.empty()) {
        usage();
        return 2;
    }

    ConfigStore store(configPath);
    ConfigPtr cfg;
    try {
        cfg = store.load();
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << "\n";
        return 1;
    }

    Logger& log = Logger::instance();
    if (logPath.empty()) logPath = cfg->global.logging.path;
    if (!logPath.empty()) log.open(logPath);
    const char* envLevel = getenv("TDV_LOG_LEVEL");
    log.setLevel(parseLogLevel(envLevel ? envLevel : cfg->global.logging.level));

    logInfo("Main", "=== tdv_edge started, settings " + configPath + " ===");

    signal(SIGTERM, signalHandler);
    signal(SIGINT, signalHandler);
    signal(SIGHUP, signalHandler);
    signal(SIGPIPE, SIG_IGN);

    EdgeSupervisor supervisor(store);
    if (!supervisor.start()) return 1;

    while (running) {
        if (reloadRequested.exchange(false)) {
            logInfo("Main", "SIGHUP: reloading settings");
            supervisor.reload();
        }
        supervisor.tick(std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    supervisor.stop();
    logInfo("Main", "=== tdv_edge exited ===");
    return 0;
}
