#pragma once

namespace Berry::Core {

// Az ütemező állapotgépe: Idle -> Running -> (Rescheduled | Terminating) -> Idle
enum class RunPhase {
    IDLE,
    RUNNING,
    RESCHEDULED,
    TERMINATING
};

// Miért ért véget egy futás
enum class StopReason {
    NONE,
    USER_STOP,        // stop() / dispose()
    COMPLETED,        // idő vagy ciklusszám kimerült
    SECRET_MISSING,   // a secret eltűnt futás közben
    CONFIG_INVALID,   // futás közbeni validációs hiba
    ACTION_FAILED     // zár/felold szekvencia hibája
};

const char* runPhaseName(RunPhase phase);
const char* stopReasonName(StopReason reason);

} // namespace Berry::Core
