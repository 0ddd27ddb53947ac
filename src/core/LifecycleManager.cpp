// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/LifecycleManager.hpp"
#include "core/Programs.hpp"
#include "utils/DurationParser.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <sstream>
#include <stdexcept>

namespace Berry::Core {

    using BerryUtils::LogLevel;
    using BerryUtils::ScheduleMode;

    namespace {
        ICommandExecutor& requireExecutor(const std::shared_ptr<ICommandExecutor>& exec) {
            if (!exec) {
                throw std::invalid_argument("LifecycleManager: command executor is null");
            }
            return *exec;
        }

        std::string formatSeconds(double seconds) {
            std::ostringstream out;
            out << seconds << "s";
            return out.str();
        }
    }

    const char* startResultName(StartResult result) {
        switch (result) {
            case StartResult::Started:         return "started";
            case StartResult::AlreadyActive:   return "already-active";
            case StartResult::MissingBinaries: return "missing-binaries";
            case StartResult::MissingSecret:   return "missing-secret";
            case StartResult::InvalidConfig:   return "invalid-config";
            case StartResult::LockFailed:      return "lock-failed";
        }
        return "unknown";
    }

    LifecycleManager::LifecycleManager(std::shared_ptr<ICommandExecutor> real,
                                       ISecretStore& secretStore,
                                       BerryUtils::IConfigSource& source,
                                       BerryUtils::ILogger& logger,
                                       SecretPrompt secretPrompt)
        : realExecutor(std::move(real)),
          secrets(secretStore),
          config(source),
          log(logger),
          prompt(std::move(secretPrompt)),
          executor(requireExecutor(realExecutor), logger),
          gate(executor, logger, Programs::required()),
          detached(stats, logger),
          scheduler(executor, secretStore, source, logger, stats, timers, detached),
          loopThread(rxcpp::schedulers::make_new_thread()) {}

    LifecycleManager::~LifecycleManager() {
        stop();
        joinPreviousLoop();
    }

    StartResult LifecycleManager::start() {
        std::lock_guard<std::mutex> serial(startMutex);

        if (isActive()) {
            log.info("[Lifecycle] Already running");
            return StartResult::AlreadyActive;
        }

        const BerryUtils::Settings settings = config.load();
        executor.setEnabled(settings.dryRun);

        // 1. Binárisok
        BinaryReport report = gate.check(settings.dryRun);
        if (!report.allPresent) {
            log.notify(LogLevel::ERROR, "BlueBerry cannot start: Missing required system binaries: " +
                       BerryUtils::join(report.missing, ", ") + ". Please install them first.");
            return StartResult::MissingBinaries;
        }

        // 2. Titok
        auto secret = resolveSecret(secrets, log);
        if (!secret) {
            log.notify(LogLevel::ERROR,
                       "BlueBerry cannot start: Secret is not set. Please set your password to continue.");
            if (prompt) {
                auto entered = prompt();
                if (entered) {
                    if (storeSecret(*entered)) {
                        log.notify(LogLevel::INFO, "Secret set! Please start BlueBerry again.");
                    }
                    wipeSecret(*entered);
                }
            }
            return StartResult::MissingSecret;
        }
        wipeSecret(*secret);

        // 3. Beállítások
        ScheduleCheck check = checkSchedule(settings, settings.mode, &log);
        if (!check.valid) {
            log.notify(LogLevel::ERROR, "BlueBerry cannot start: " + check.reason + ". Please check your settings.");
            return StartResult::InvalidConfig;
        }

        // Egy korábbi futás szála még befejezheti az utolsó akcióját
        joinPreviousLoop();

        RunState state;
        state.mode = settings.mode;
        state.startedAt = std::chrono::steady_clock::now();
        state.bounded = settings.mode == ScheduleMode::CycleCount && settings.stopAfterCycles > 0;
        state.remainingCycles = state.bounded ? settings.stopAfterCycles : 0;

        rxcpp::composite_subscription token;
        {
            std::lock_guard<std::mutex> guard(lock);
            active = true;
            runToken = token;
        }
        stats.mark_run_start();
        stats.last_stop.store(StopReason::NONE);

        try {
            scheduler.sequencer().initialLock();
        } catch (const CommandError& e) {
            log.error(std::string("[Lifecycle] Initial lock failed: ") + e.what());
            {
                std::lock_guard<std::mutex> guard(lock);
                active = false;
            }
            token.unsubscribe();
            stats.last_stop.store(StopReason::ACTION_FAILED);
            log.notify(LogLevel::ERROR, std::string("BlueBerry cannot start: ") + e.what() + ".");
            return StartResult::LockFailed;
        }

        const std::string dryTag = settings.dryRun ? " (DRY-RUN)" : "";
        std::string runLabel;
        if (settings.mode == ScheduleMode::Duration) {
            runLabel = settings.duration;
            log.notify(LogLevel::INFO, "BlueBerry started" + dryTag + ". Will run for " + settings.duration +
                       " with " + settings.lockIntervalMin + "-" + settings.lockIntervalMax + " intervals.");
        } else {
            runLabel = state.bounded ? std::to_string(settings.stopAfterCycles) + " cycles" : "until stopped";
            log.notify(LogLevel::INFO, "BlueBerry started" + dryTag + ". Will run " + runLabel +
                       " with " + formatSeconds(settings.napTimeS) + " lock holds.");
        }
        log.info(std::string("[Lifecycle] Running in ") + BerryUtils::scheduleModeName(settings.mode) + " mode");

        // Ciklus indítása a saját szálán
        rxcpp::composite_subscription lifetime;
        {
            std::lock_guard<std::mutex> guard(lock);
            looping = true;
            loopLifetime = lifetime;
        }
        auto worker = loopThread.create_worker(lifetime);
        worker.schedule([this, token, state, runLabel](const rxcpp::schedulers::schedulable&) {
            RunResult result = scheduler.run(token, state);
            onRunFinished(token, result, state.mode, runLabel);
            {
                std::lock_guard<std::mutex> guard(lock);
                looping = false;
            }
            idle.notify_all();
        });

        return StartResult::Started;
    }

    std::size_t LifecycleManager::drainTimers() {
        std::size_t cancelled = timers.cancelAll();
        stats.timers_cancelled += cancelled;
        return cancelled;
    }

    void LifecycleManager::stop() {
        bool wasActive;
        rxcpp::composite_subscription token;
        {
            std::lock_guard<std::mutex> guard(lock);
            wasActive = active;
            active = false;
            token = runToken;
        }

        std::size_t cancelled = drainTimers();
        // A token leiratkozása felébreszti a közben regisztrált várakozásokat is
        if (token.is_subscribed()) {
            token.unsubscribe();
        }
        cancelled += drainTimers();

        if (wasActive) {
            stats.last_stop.store(StopReason::USER_STOP);
            log.info("[Lifecycle] Stopped, " + std::to_string(cancelled) + " pending timer(s) cancelled");
            log.notify(LogLevel::INFO, "BlueBerry is stopped.");
        }
    }

    void LifecycleManager::dispose() {
        stop();
    }

    void LifecycleManager::onRunFinished(const rxcpp::composite_subscription& token, const RunResult& result,
                                         ScheduleMode mode, const std::string& runLabel) {
        {
            std::lock_guard<std::mutex> guard(lock);
            if (!active || !(runToken == token)) {
                return; // stop() már lezárta ezt a futást
            }
            active = false;
        }
        drainTimers();
        if (token.is_subscribed()) {
            token.unsubscribe();
        }
        drainTimers();

        switch (result.outcome) {
            case RunOutcome::Completed:
                stats.last_stop.store(StopReason::COMPLETED);
                if (mode == ScheduleMode::Duration) {
                    log.notify(LogLevel::INFO, "BlueBerry finished after " + runLabel + ". Logged out.");
                } else {
                    log.notify(LogLevel::INFO, "BlueBerry finished after " + std::to_string(result.cycles) +
                               " cycles.");
                }
                break;
            case RunOutcome::SecretMissing:
                stats.last_stop.store(StopReason::SECRET_MISSING);
                log.notify(LogLevel::ERROR,
                           "BlueBerry stopped: Secret is not set. Please set your password to continue.");
                break;
            case RunOutcome::ConfigInvalid:
                stats.last_stop.store(StopReason::CONFIG_INVALID);
                log.notify(LogLevel::ERROR, "BlueBerry stopped: " + result.reason + ". Please check your settings.");
                break;
            case RunOutcome::ActionFailed:
                stats.last_stop.store(StopReason::ACTION_FAILED);
                log.notify(LogLevel::ERROR, "BlueBerry stopped: " + result.reason + ".");
                break;
            case RunOutcome::Stopped:
                stats.last_stop.store(StopReason::USER_STOP);
                log.info("[Lifecycle] Run cancelled");
                break;
        }
    }

    void LifecycleManager::joinPreviousLoop() {
        rxcpp::composite_subscription previous;
        {
            std::lock_guard<std::mutex> guard(lock);
            previous = loopLifetime;
            loopLifetime = rxcpp::composite_subscription();
        }
        // new_thread worker: a leiratkozás megvárja a szál kilépését
        if (previous.is_subscribed()) {
            previous.unsubscribe();
        }
    }

    bool LifecycleManager::isActive() const {
        std::lock_guard<std::mutex> guard(lock);
        return active;
    }

    bool LifecycleManager::waitUntilIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> guard(lock);
        return idle.wait_for(guard, timeout, [this] { return !looping; });
    }

    bool LifecycleManager::storeSecret(const std::string& value) {
        std::string trimmed = BerryUtils::trim(value);
        if (trimmed.empty()) {
            log.warn("[Secret] Empty secret rejected");
            return false;
        }
        try {
            secrets.set(trimmed);
        } catch (const SecretStoreError& e) {
            wipeSecret(trimmed);
            log.error(std::string("[Secret] ") + e.what());
            return false;
        }
        wipeSecret(trimmed);
        return true;
    }

    bool LifecycleManager::setSecret(const std::string& value) {
        if (!storeSecret(value)) {
            log.notify(LogLevel::ERROR, "Password was not updated.");
            return false;
        }
        log.notify(LogLevel::INFO, "Password updated securely.");
        return true;
    }

    bool LifecycleManager::clearSecret() {
        try {
            secrets.clear();
        } catch (const SecretStoreError& e) {
            log.error(std::string("[Secret] ") + e.what());
            log.notify(LogLevel::ERROR, "BlueBerry secret could not be cleared.");
            return false;
        }
        log.notify(LogLevel::INFO, "BlueBerry secret has been cleared.");
        return true;
    }

    BinaryReport LifecycleManager::checkBinaries(bool dryRun) {
        executor.setEnabled(dryRun);
        return gate.check(dryRun);
    }
}
