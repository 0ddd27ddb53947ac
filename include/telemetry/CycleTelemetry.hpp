#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "telemetry/TelemetryTypes.hpp"
#include "telemetry/TelemetrySnapshot.hpp"

namespace Berry::Core {

/**
 * @brief Az ütemező számlálói és diagnosztikai nyelője.
 * A detached (fire-and-forget) akciók hibái ide kerülnek, nem vesznek el.
 */
struct CycleTelemetry {
    // Cycle counters
    std::atomic<uint64_t> cycles_completed{0};
    std::atomic<uint64_t> locks{0};
    std::atomic<uint64_t> unlocks{0};

    // Best-effort failures
    std::atomic<uint64_t> enumeration_failures{0};
    std::atomic<uint64_t> device_toggle_failures{0};
    std::atomic<uint64_t> detached_failures{0};

    std::atomic<uint64_t> timers_cancelled{0};

    // State
    std::atomic<RunPhase> phase{RunPhase::IDLE};
    std::atomic<StopReason> last_stop{StopReason::NONE};

    CycleTelemetry();

    void record_detached_failure(const std::string& what);
    void set_phase(RunPhase p) { phase.store(p); }
    void mark_run_start();

    [[nodiscard]] TelemetrySnapshot snapshot() const;

private:
    mutable std::mutex error_mutex;
    std::string last_detached_error;

    std::atomic<int64_t> run_start_ms{0};
};

} // namespace Berry::Core
