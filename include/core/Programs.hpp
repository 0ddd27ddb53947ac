// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#ifndef BERRY_PROGRAMS_HPP
#define BERRY_PROGRAMS_HPP

#include <string>
#include <vector>

namespace Berry::Core::Programs {

    inline constexpr const char* LOCK     = "ft_lock";   // session lock
    inline constexpr const char* XDOTOOL  = "xdotool";   // type / key
    inline constexpr const char* XSET     = "xset";      // dpms force off
    inline constexpr const char* XINPUT   = "xinput";    // list / enable / disable
    inline constexpr const char* LOGINCTL = "loginctl";  // list-sessions / terminate-session
    inline constexpr const char* WHICH    = "which";

    inline const std::vector<std::string>& required() {
        static const std::vector<std::string> names = { LOCK, XDOTOOL, XSET, XINPUT, LOGINCTL };
        return names;
    }
}

#endif
