// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/InputAccess.hpp"
#include "core/Programs.hpp"
#include "telemetry/CycleTelemetry.hpp"
#include "utils/Logger.hpp"

#include <string>

namespace Berry::Core {

    InputAccessController::InputAccessController(ICommandExecutor& exec, BerryUtils::ILogger& logger,
                                                 CycleTelemetry* stats)
        : executor(exec), log(logger), telemetry(stats) {}

    void InputAccessController::toggle(const char* action, const std::vector<int>& ids) {
        for (int id : ids) {
            Command cmd{Programs::XINPUT, {action, std::to_string(id)}};
            try {
                int code = executor.run(cmd);
                if (code != 0) {
                    log.debug("[Input] " + cmd.render() + " exited with code " + std::to_string(code));
                    if (telemetry) telemetry->device_toggle_failures++;
                }
            } catch (const CommandError& e) {
                log.debug(std::string("[Input] ") + e.what());
                if (telemetry) telemetry->device_toggle_failures++;
            }
        }
    }

    void InputAccessController::disable(const std::vector<int>& ids) {
        toggle("disable", ids);
    }

    void InputAccessController::enable(const std::vector<int>& ids) {
        toggle("enable", ids);
    }
}
