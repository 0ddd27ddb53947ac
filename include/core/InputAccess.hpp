// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#ifndef INPUT_ACCESS_HPP
#define INPUT_ACCESS_HPP

#include "core/CommandExecutor.hpp"
#include <vector>

namespace BerryUtils { class ILogger; }

namespace Berry::Core {

    struct CycleTelemetry;

    /**
     * @brief Input Access Controller: xinput enable/disable eszközönként.
     * Best-effort: egy nem válaszoló eszköz nem állíthatja meg a többit, sem a ciklust.
     */
    class InputAccessController {
    public:
        InputAccessController(ICommandExecutor& executor, BerryUtils::ILogger& log,
                              CycleTelemetry* telemetry = nullptr);

        void disable(const std::vector<int>& ids);
        void enable(const std::vector<int>& ids);

    private:
        ICommandExecutor& executor;
        BerryUtils::ILogger& log;
        CycleTelemetry* telemetry;

        void toggle(const char* action, const std::vector<int>& ids);
    };
}

#endif
