// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#ifndef SESSION_CONTROL_HPP
#define SESSION_CONTROL_HPP

#include "core/CommandExecutor.hpp"
#include <optional>
#include <string>

namespace BerryUtils { class ILogger; }

namespace Berry::Core {

    /**
     * @brief Az első login session azonosítója a "loginctl list-sessions --no-legend"
     * kimenetéből: első nem üres sor, első whitespace mező.
     */
    std::optional<std::string> parseFirstSessionId(const std::string& listing);

    // Duration mód vége: a felhasználói session lezárása.
    class SessionTerminator {
    public:
        SessionTerminator(ICommandExecutor& executor, BerryUtils::ILogger& log);

        std::optional<std::string> currentSessionId();

        // true, ha talált sessiont és a terminate-session lefutott
        bool terminate();

    private:
        ICommandExecutor& executor;
        BerryUtils::ILogger& log;
    };
}

#endif
