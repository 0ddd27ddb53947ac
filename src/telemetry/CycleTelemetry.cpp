// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "telemetry/CycleTelemetry.hpp"

namespace Berry::Core {

namespace {
    int64_t steady_now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }
}

const char* runPhaseName(RunPhase phase) {
    switch (phase) {
        case RunPhase::IDLE:        return "idle";
        case RunPhase::RUNNING:     return "running";
        case RunPhase::RESCHEDULED: return "rescheduled";
        case RunPhase::TERMINATING: return "terminating";
    }
    return "unknown";
}

const char* stopReasonName(StopReason reason) {
    switch (reason) {
        case StopReason::NONE:           return "none";
        case StopReason::USER_STOP:      return "user-stop";
        case StopReason::COMPLETED:      return "completed";
        case StopReason::SECRET_MISSING: return "secret-missing";
        case StopReason::CONFIG_INVALID: return "config-invalid";
        case StopReason::ACTION_FAILED:  return "action-failed";
    }
    return "unknown";
}

CycleTelemetry::CycleTelemetry()
    : run_start_ms(steady_now_ms())
{
}

void CycleTelemetry::mark_run_start() {
    run_start_ms.store(steady_now_ms());
}

void CycleTelemetry::record_detached_failure(const std::string& what) {
    detached_failures++;
    std::lock_guard<std::mutex> guard(error_mutex);
    last_detached_error = what;
}

TelemetrySnapshot CycleTelemetry::snapshot() const {
    TelemetrySnapshot snap{};

    snap.cycles_completed = cycles_completed.load();
    snap.locks            = locks.load();
    snap.unlocks          = unlocks.load();

    snap.enumeration_failures   = enumeration_failures.load();
    snap.device_toggle_failures = device_toggle_failures.load();
    snap.detached_failures      = detached_failures.load();
    {
        std::lock_guard<std::mutex> guard(error_mutex);
        snap.last_detached_error = last_detached_error;
    }

    snap.timers_cancelled = timers_cancelled.load();

    snap.phase     = phase.load();
    snap.last_stop = last_stop.load();
    snap.run_ms    = static_cast<uint64_t>(steady_now_ms() - run_start_ms.load());

    return snap;
}

} // namespace Berry::Core
