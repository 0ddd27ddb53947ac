#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <chrono>
#include <signal.h>
#include <ctime>
#include <sodium.h>
#include <termios.h>
#include <unistd.h>

#include "core/LifecycleManager.hpp"
#include "core/Programs.hpp"
#include "core/SafeExecutor.hpp"
#include "core/SecretStore.hpp"
#include "utils/BerryInitializer.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/HardeningUtils.hpp"
#include "utils/Logger.hpp"
#include "utils/Settings.hpp"
#include "utils/StringUtils.hpp"

using Berry::Core::LifecycleManager;
using Berry::Core::StartResult;

namespace {

    struct CliOptions {
        std::string command;
        std::string configPath;
        std::string logFile;
        bool dryRun = false;
        bool verbose = false;
    };

    void printUsage(const char* prog) {
        std::cout << "Usage: " << prog << " [--config <path>] [--dry-run] [--verbose] [--log-file <path>] <command>\n"
                  << "\n"
                  << "Commands:\n"
                  << "  start         run the lock cycle in the foreground (SIGINT/SIGTERM stops it)\n"
                  << "  set-secret    store the unlock password\n"
                  << "  clear-secret  delete the stored password\n"
                  << "  init-config   write the default configuration file\n"
                  << "  check         verify the required system binaries\n";
    }

    bool parseArgs(int argc, char* argv[], CliOptions& opts) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--dry-run") {
                opts.dryRun = true;
            } else if (arg == "--verbose") {
                opts.verbose = true;
            } else if ((arg == "--config" || arg == "--log-file") && i + 1 < argc) {
                (arg == "--config" ? opts.configPath : opts.logFile) = argv[++i];
            } else if (!arg.empty() && arg[0] != '-' && opts.command.empty()) {
                opts.command = arg;
            } else {
                std::cerr << "[CLI] Unknown or incomplete argument: " << arg << std::endl;
                return false;
            }
        }
        return !opts.command.empty();
    }

    // Jelszó bekérése visszhang nélkül (terminálon), különben egy sor a stdin-ről.
    std::optional<std::string> readSecret() {
        std::string line;
        if (isatty(STDIN_FILENO)) {
            std::cout << "Enter BlueBerry password: " << std::flush;

            termios oldt{};
            if (tcgetattr(STDIN_FILENO, &oldt) != 0) {
                return std::nullopt;
            }
            termios newt = oldt;
            newt.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            tcsetattr(STDIN_FILENO, TCSANOW, &newt);
            bool ok = static_cast<bool>(std::getline(std::cin, line));
            tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
            std::cout << std::endl;
            if (!ok) return std::nullopt;
        } else if (!std::getline(std::cin, line)) {
            return std::nullopt;
        }
        return line;
    }

    // Foreground futás: SIGINT/SIGTERM vagy a futás vége.
    int runForeground(LifecycleManager& manager, const sigset_t& stopSignals) {
        StartResult result = manager.start();
        if (result != StartResult::Started) {
            std::cerr << "[CLI] Start refused: " << Berry::Core::startResultName(result) << std::endl;
            return 1;
        }

        timespec tick{0, 200 * 1000 * 1000};
        while (manager.isActive()) {
            int sig = sigtimedwait(&stopSignals, nullptr, &tick);
            if (sig == SIGINT || sig == SIGTERM) {
                std::cout << "\n[CLI] Signal " << sig << " received, stopping..." << std::endl;
                manager.stop();
                break;
            }
        }

        manager.waitUntilIdle(std::chrono::seconds(10));

        auto snap = manager.telemetry();
        std::cout << "[CLI] cycles=" << snap.cycles_completed
                  << " locks=" << snap.locks
                  << " unlocks=" << snap.unlocks
                  << " detached_failures=" << snap.detached_failures
                  << " last_stop=" << Berry::Core::stopReasonName(snap.last_stop) << std::endl;
        return snap.last_stop == Berry::Core::StopReason::COMPLETED ||
               snap.last_stop == Berry::Core::StopReason::USER_STOP ? 0 : 1;
    }
}

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 2;
    }

    // A jelzéseket minden szál előtt blokkoljuk, így csak a sigtimedwait kapja meg őket
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    if (sodium_init() < 0) {
        std::cerr << "[CLI] libsodium initialisation failed" << std::endl;
        return 1;
    }

    Berry::Init::purgeUnsafeEnvironment();
    if (Berry::Init::isRoot()) {
        std::cerr << "[!] Running as root: the cycle drives the current user's X session. [!]" << std::endl;
    }
    if (!Berry::Init::createSecureSkeleton()) {
        std::cerr << "[CLI] Cannot create state directory " << Berry::Init::stateDirectory() << std::endl;
        return 1;
    }

    BerryUtils::ConsoleLogger logger(opts.verbose, opts.logFile);
    if (opts.dryRun) {
        logger.notify(BerryUtils::LogLevel::INFO, "DRY-RUN MODE ACTIVATED - NO COMMANDS WILL BE EXECUTED");
    }

    const std::string configPath = opts.configPath.empty() ? BerryUtils::defaultConfigPath() : opts.configPath;

    if (opts.command == "init-config") {
        if (!BerryUtils::writeProtectedFile(configPath, BerryTemplates::DEFAULT_CONFIG_CONTENT)) {
            return 1;
        }
        logger.info("[CLI] Default configuration written to " + configPath);
        return 0;
    }

    BerryUtils::FileConfigSource config(configPath, &logger);
    config.forceDryRun(opts.dryRun);

    Berry::Core::FileSecretStore secrets(Berry::Core::defaultSecretPath());

    LifecycleManager::SecretPrompt prompt;
    if (isatty(STDIN_FILENO)) {
        prompt = readSecret;
    }

    LifecycleManager manager(std::make_shared<Berry::Core::SafeExecutor>(), secrets, config, logger, prompt);

    if (opts.command == "start") {
        return runForeground(manager, stopSignals);
    }

    if (opts.command == "set-secret") {
        auto value = readSecret();
        if (!value) {
            logger.error("[CLI] No secret provided");
            return 1;
        }
        bool ok = manager.setSecret(*value);
        Berry::Core::wipeSecret(*value);
        return ok ? 0 : 1;
    }

    if (opts.command == "clear-secret") {
        return manager.clearSecret() ? 0 : 1;
    }

    if (opts.command == "check") {
        bool dryRun = config.load().dryRun;
        auto report = manager.checkBinaries(dryRun);
        for (const auto& name : Berry::Core::Programs::required()) {
            bool missing = false;
            for (const auto& m : report.missing) {
                if (m == name) missing = true;
            }
            std::cout << (missing ? "[MISSING] " : "[OK] ") << name << std::endl;
        }
        return report.allPresent ? 0 : 1;
    }

    std::cerr << "[CLI] Unknown command: " << opts.command << std::endl;
    printUsage(argv[0]);
    return 2;
}
