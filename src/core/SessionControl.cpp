// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/SessionControl.hpp"
#include "core/Programs.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <sstream>

namespace Berry::Core {

    std::optional<std::string> parseFirstSessionId(const std::string& listing) {
        for (const auto& raw : BerryUtils::splitLines(listing)) {
            std::string line = BerryUtils::trim(raw);
            if (line.empty()) continue;

            std::istringstream fields(line);
            std::string id;
            fields >> id;
            if (!id.empty()) return id;
        }
        return std::nullopt;
    }

    SessionTerminator::SessionTerminator(ICommandExecutor& exec, BerryUtils::ILogger& logger)
        : executor(exec), log(logger) {}

    std::optional<std::string> SessionTerminator::currentSessionId() {
        try {
            std::string out = executor.capture(Command{Programs::LOGINCTL, {"list-sessions", "--no-legend"}});
            log.debug("[Session] loginctl output: " + BerryUtils::trim(out));

            auto id = parseFirstSessionId(out);
            if (id) {
                log.info("[Session] Found session ID: " + *id);
            } else {
                log.warn("[Session] No login session found");
            }
            return id;
        } catch (const CommandError& e) {
            log.error(std::string("[Session] Error getting session ID: ") + e.what());
            return std::nullopt;
        }
    }

    bool SessionTerminator::terminate() {
        auto id = currentSessionId();
        if (!id) return false;

        Command cmd{Programs::LOGINCTL, {"terminate-session", *id}};
        try {
            int code = executor.run(cmd);
            if (code != 0) {
                log.error("[Session] " + cmd.render() + " exited with code " + std::to_string(code));
                return false;
            }
        } catch (const CommandError& e) {
            log.error(std::string("[Session] ") + e.what());
            return false;
        }
        log.info("[Session] Terminated session " + *id);
        return true;
    }
}
