// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// Cycle Scheduler: the lock / hold / unlock state machine

#ifndef CYCLE_SCHEDULER_HPP
#define CYCLE_SCHEDULER_HPP

#include <chrono>
#include <string>

#include <rxcpp/rx.hpp>

#include "core/DeviceEnumerator.hpp"
#include "core/InputAccess.hpp"
#include "core/LockSequencer.hpp"
#include "core/SessionControl.hpp"
#include "utils/Settings.hpp"

namespace Berry::Core {

    class DryRunExecutor;
    class DetachedRunner;
    class ISecretStore;
    class PendingTimers;
    struct CycleTelemetry;

    // Duration módban a feloldott állapot tartási ideje.
    constexpr std::chrono::milliseconds UNLOCKED_HOLD{500};

    struct ScheduleCheck {
        bool valid = true;
        std::string reason;
    };

    /**
     * @brief A beállítások ellenőrzése a futás módja szerint.
     * Duration: min <= max <= 30 perc. Cycles: napTimeS, weakTimeS véges és >= 0.
     */
    ScheduleCheck checkSchedule(const BerryUtils::Settings& settings, BerryUtils::ScheduleMode mode,
                                BerryUtils::ILogger* log = nullptr);

    // A start()-kor rögzített futási állapot, iterációról iterációra továbbadva.
    struct RunState {
        BerryUtils::ScheduleMode mode = BerryUtils::ScheduleMode::Duration;
        std::chrono::steady_clock::time_point startedAt{};
        bool bounded = false;       // cycles mód, stopAfterCycles > 0
        unsigned remainingCycles = 0;
        unsigned cycle = 0;
    };

    enum class RunOutcome {
        Stopped,        // token megszakítva
        Completed,      // idő letelt / ciklusszám elfogyott
        SecretMissing,
        ConfigInvalid,
        ActionFailed
    };

    struct RunResult {
        RunOutcome outcome = RunOutcome::Stopped;
        std::string reason;
        unsigned cycles = 0;
    };

    /**
     * @brief Explicit ciklus a futás tokenjével. A megszakítás csak a ciklus elején
     * és a két időzített várakozásnál figyelt.
     */
    class CycleScheduler {
    public:
        CycleScheduler(DryRunExecutor& executor, ISecretStore& secrets,
                       BerryUtils::IConfigSource& config, BerryUtils::ILogger& log,
                       CycleTelemetry& telemetry, PendingTimers& timers, DetachedRunner& detached);

        /**
         * @brief A teljes futás: visszatér, ha a token megszakad vagy a futás véget ér.
         * Kivételt nem enged ki: a CommandError ActionFailed eredménnyé válik.
         */
        RunResult run(rxcpp::composite_subscription token, RunState state);

        LockSequencer& sequencer() { return actions; }

    private:
        DryRunExecutor& executor;
        ISecretStore& secrets;
        BerryUtils::IConfigSource& config;
        BerryUtils::ILogger& log;
        CycleTelemetry& telemetry;
        PendingTimers& timers;

        DeviceEnumerator devices;
        InputAccessController input;
        LockSequencer actions;
        SessionTerminator terminator;

        RunResult loop(const rxcpp::composite_subscription& token, RunState& state);
    };
}

#endif
