// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/CycleScheduler.hpp"
#include "core/DetachedRunner.hpp"
#include "core/DryRunExecutor.hpp"
#include "core/PendingTimers.hpp"
#include "core/SecretStore.hpp"
#include "telemetry/CycleTelemetry.hpp"
#include "utils/DurationParser.hpp"
#include "utils/Logger.hpp"

#include <cmath>

namespace Berry::Core {

    using BerryUtils::ScheduleMode;
    using std::chrono::milliseconds;

    namespace {
        // Az iteráció végén a titok másolata nullázva
        struct ScopedWipe {
            std::string& value;
            ~ScopedWipe() { wipeSecret(value); }
        };

        bool validSeconds(double v) {
            return std::isfinite(v) && v >= 0.0;
        }
    }

    ScheduleCheck checkSchedule(const BerryUtils::Settings& settings, ScheduleMode mode,
                                BerryUtils::ILogger* log) {
        ScheduleCheck check;

        if (mode == ScheduleMode::Duration) {
            const milliseconds minMs = BerryUtils::parseDuration(settings.lockIntervalMin, log);
            const milliseconds maxMs = BerryUtils::parseDuration(settings.lockIntervalMax, log);
            auto intervals = BerryUtils::validateLockIntervals(minMs, maxMs);
            check.valid = intervals.valid;
            check.reason = intervals.reason;
            return check;
        }

        const std::string limit = std::to_string(static_cast<long long>(BerryUtils::MAX_HOLD_SECONDS));
        if (!validSeconds(settings.napTimeS)) {
            check.valid = false;
            check.reason = "napTimeS must be a non-negative number";
        } else if (settings.napTimeS > BerryUtils::MAX_HOLD_SECONDS) {
            check.valid = false;
            check.reason = "napTimeS exceeds " + limit + " seconds limit";
        } else if (!validSeconds(settings.weakTimeS)) {
            check.valid = false;
            check.reason = "weakTimeS must be a non-negative number";
        } else if (settings.weakTimeS > BerryUtils::MAX_HOLD_SECONDS) {
            check.valid = false;
            check.reason = "weakTimeS exceeds " + limit + " seconds limit";
        }
        return check;
    }

    CycleScheduler::CycleScheduler(DryRunExecutor& exec, ISecretStore& secretStore,
                                   BerryUtils::IConfigSource& source, BerryUtils::ILogger& logger,
                                   CycleTelemetry& stats, PendingTimers& pending, DetachedRunner& detached)
        : executor(exec),
          secrets(secretStore),
          config(source),
          log(logger),
          telemetry(stats),
          timers(pending),
          devices(exec, logger, &stats),
          input(exec, logger, &stats),
          actions(exec, detached, logger, stats),
          terminator(exec, logger) {}

    RunResult CycleScheduler::run(rxcpp::composite_subscription token, RunState state) {
        RunResult result;
        try {
            result = loop(token, state);
        } catch (const CommandError& e) {
            log.error(std::string("[Scheduler] Action failed: ") + e.what());
            result.outcome = RunOutcome::ActionFailed;
            result.reason = e.what();
        } catch (const std::exception& e) {
            log.error(std::string("[Scheduler] Unexpected error: ") + e.what());
            result.outcome = RunOutcome::ActionFailed;
            result.reason = e.what();
        }
        result.cycles = state.cycle;
        telemetry.set_phase(RunPhase::IDLE);
        return result;
    }

    RunResult CycleScheduler::loop(const rxcpp::composite_subscription& token, RunState& state) {
        RunResult stopped{RunOutcome::Stopped, "", 0};

        for (;;) {
            if (!token.is_subscribed()) return stopped;

            // 1. Titok újraolvasása
            auto resolved = resolveSecret(secrets, log);
            if (!resolved) {
                log.warn("[Scheduler] Secret is not set, ending run");
                return RunResult{RunOutcome::SecretMissing, "Secret is not set", 0};
            }
            std::string secret = std::move(*resolved);
            wipeSecret(*resolved);
            ScopedWipe wipe{secret};

            if (!token.is_subscribed()) return stopped;

            telemetry.set_phase(RunPhase::RUNNING);
            log.info("[Scheduler] ===== New cycle started =====");

            // 2. Beállítások frissen
            const BerryUtils::Settings settings = config.load();
            executor.setEnabled(settings.dryRun);

            auto check = checkSchedule(settings, state.mode, &log);
            if (!check.valid) {
                log.error("[Scheduler] Invalid configuration: " + check.reason);
                return RunResult{RunOutcome::ConfigInvalid, check.reason, 0};
            }

            // 3. Leállási feltétel
            if (state.mode == ScheduleMode::Duration) {
                const milliseconds total = BerryUtils::parseDuration(settings.duration, &log);
                const auto elapsed = std::chrono::duration_cast<milliseconds>(
                    std::chrono::steady_clock::now() - state.startedAt);
                log.debug("[Scheduler] Elapsed " + std::to_string(elapsed.count()) + "ms of " +
                          std::to_string(total.count()) + "ms");

                if (elapsed >= total) {
                    telemetry.set_phase(RunPhase::TERMINATING);
                    log.info("[Scheduler] Duration reached, terminating session");
                    terminator.terminate();
                    return RunResult{RunOutcome::Completed, "", 0};
                }
            } else if (state.bounded && state.remainingCycles == 0) {
                telemetry.set_phase(RunPhase::TERMINATING);
                log.info("[Scheduler] Cycle limit reached, final lock");
                actions.lockPhase();
                return RunResult{RunOutcome::Completed, "", 0};
            }

            // 4. Tartási idők
            milliseconds lockHold;
            milliseconds unlockHold;
            if (state.mode == ScheduleMode::Duration) {
                lockHold = BerryUtils::drawLockInterval(
                    BerryUtils::parseDuration(settings.lockIntervalMin, &log),
                    BerryUtils::parseDuration(settings.lockIntervalMax, &log));
                unlockHold = UNLOCKED_HOLD;
            } else {
                lockHold = BerryUtils::secondsToMillis(settings.napTimeS);
                unlockHold = BerryUtils::secondsToMillis(settings.weakTimeS);
            }
            log.info("[Scheduler] Cycle " + std::to_string(state.cycle + 1) + ": locked for " +
                     std::to_string(lockHold.count()) + "ms");

            // 5-6.
            const DeviceSet found = devices.enumerate();
            log.debug("[Scheduler] Devices: " + std::to_string(found.mice.size()) + " pointer(s), " +
                      std::to_string(found.keyboards.size()) + " keyboard(s)");
            actions.lockPhase();

            // 7.
            if (!timers.sleepFor(lockHold, token)) {
                log.debug("[Scheduler] Locked hold cancelled");
                return stopped;
            }
            actions.forceDisplayOff();

            // 8-9.
            input.disable(found.mice);
            input.disable(found.keyboards);
            actions.unlockPhase(secret);

            // 10.
            if (!timers.sleepFor(unlockHold, token)) {
                log.debug("[Scheduler] Unlocked hold cancelled");
                return stopped;
            }
            actions.forceDisplayOff();

            // 11.
            input.enable(found.mice);
            input.enable(found.keyboards);

            ++state.cycle;
            telemetry.cycles_completed++;

            // 12.
            if (!token.is_subscribed()) return stopped;
            if (state.bounded && state.remainingCycles > 0) {
                --state.remainingCycles;
            }
            telemetry.set_phase(RunPhase::RESCHEDULED);
        }
    }
}
