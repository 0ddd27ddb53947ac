// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// start / stop / dispose around one scheduler run

#ifndef LIFECYCLE_MANAGER_HPP
#define LIFECYCLE_MANAGER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <rxcpp/rx.hpp>

#include "core/BinaryGate.hpp"
#include "core/CycleScheduler.hpp"
#include "core/DetachedRunner.hpp"
#include "core/DryRunExecutor.hpp"
#include "core/PendingTimers.hpp"
#include "core/SecretStore.hpp"
#include "telemetry/CycleTelemetry.hpp"

namespace Berry::Core {

    enum class StartResult {
        Started,
        AlreadyActive,
        MissingBinaries,
        MissingSecret,
        InvalidConfig,
        LockFailed
    };

    const char* startResultName(StartResult result);

    /**
     * @brief Lifecycle Manager.
     * A start() ellenőrzi az előfeltételeket, majd egy dedikált rxcpp new_thread
     * workeren elindítja a CycleScheduler ciklusát. A stop() bármely szálról hívható,
     * idempotens, és sosem blokkol egy éppen futó akcióra.
     */
    class LifecycleManager {
    public:
        using SecretPrompt = std::function<std::optional<std::string>()>;

        LifecycleManager(std::shared_ptr<ICommandExecutor> realExecutor,
                         ISecretStore& secrets,
                         BerryUtils::IConfigSource& config,
                         BerryUtils::ILogger& log,
                         SecretPrompt prompt = {});
        ~LifecycleManager();

        LifecycleManager(const LifecycleManager&) = delete;
        LifecycleManager& operator=(const LifecycleManager&) = delete;

        StartResult start();
        void stop();
        void dispose();

        bool setSecret(const std::string& value);
        bool clearSecret();

        bool isActive() const;

        // true, ha a ciklus szála befejezte a munkát a határidőn belül
        bool waitUntilIdle(std::chrono::milliseconds timeout);

        std::size_t pendingTimerCount() const { return timers.size(); }

        TelemetrySnapshot telemetry() const { return stats.snapshot(); }

        // "check" parancs: a gate jelentése a megadott módban
        BinaryReport checkBinaries(bool dryRun);

    private:
        std::shared_ptr<ICommandExecutor> realExecutor;
        ISecretStore& secrets;
        BerryUtils::IConfigSource& config;
        BerryUtils::ILogger& log;
        SecretPrompt prompt;

        CycleTelemetry stats;
        DryRunExecutor executor;
        BinaryGate gate;
        PendingTimers timers;
        DetachedRunner detached;
        CycleScheduler scheduler;

        rxcpp::schedulers::scheduler loopThread;

        std::mutex startMutex;
        mutable std::mutex lock;
        std::condition_variable idle;
        bool active = false;
        bool looping = false;
        rxcpp::composite_subscription runToken;
        rxcpp::composite_subscription loopLifetime;

        bool storeSecret(const std::string& value);
        void joinPreviousLoop();
        void onRunFinished(const rxcpp::composite_subscription& token, const RunResult& result,
                           BerryUtils::ScheduleMode mode, const std::string& runLabel);
        std::size_t drainTimers();
    };
}

#endif
