// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/DryRunExecutor.hpp"
#include "core/Programs.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/Logger.hpp"

namespace Berry::Core {

    DryRunExecutor::DryRunExecutor(ICommandExecutor& realExecutor, BerryUtils::ILogger& logger)
        : real(realExecutor), log(logger) {}

    void DryRunExecutor::logCommand(const Command& cmd) {
        log.info("[DRY-RUN] Would execute: " + cmd.render());
    }

    std::string DryRunExecutor::mockOutput(const Command& cmd) {
        if (cmd.program == Programs::XINPUT && !cmd.args.empty() && cmd.args[0] == "list") {
            return BerryTemplates::MOCK_XINPUT_LISTING;
        }
        if (cmd.program == Programs::LOGINCTL && cmd.args.size() >= 2 &&
            cmd.args[0] == "list-sessions" && cmd.args[1] == "--no-legend") {
            return BerryTemplates::MOCK_LOGINCTL_SESSIONS;
        }
        return "";
    }

    int DryRunExecutor::run(const Command& cmd) {
        if (enabled.load()) {
            logCommand(cmd);
            return 0;
        }
        return real.run(cmd);
    }

    std::string DryRunExecutor::capture(const Command& cmd) {
        if (enabled.load()) {
            logCommand(cmd);
            return mockOutput(cmd);
        }
        return real.capture(cmd);
    }
}
