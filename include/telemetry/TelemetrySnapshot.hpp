#pragma once

#include <cstdint>
#include <string>
#include "telemetry/TelemetryTypes.hpp"

namespace Berry::Core {

struct TelemetrySnapshot {
    // --- Cycle Metrics ---
    uint64_t cycles_completed;
    uint64_t locks;
    uint64_t unlocks;

    // --- Best-effort hibák ---
    uint64_t enumeration_failures;
    uint64_t device_toggle_failures;
    uint64_t detached_failures;
    std::string last_detached_error;

    // --- Timers ---
    uint64_t timers_cancelled;

    // --- State ---
    RunPhase phase;
    StopReason last_stop;
    uint64_t run_ms; // az aktuális / utolsó futás kezdete óta eltelt idő
};

} // namespace Berry::Core
