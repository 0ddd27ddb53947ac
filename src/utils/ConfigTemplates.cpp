// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "utils/ConfigTemplates.hpp"

namespace BerryTemplates {

    const std::vector<std::string> DEFAULT_CONFIG_CONTENT = {
        "# BlueBerry - session lock cycler",
        "# key=value, one per line. The file is re-read at the start of every cycle.",
        "",
        "# Replace every external command with a 'Would execute:' log line.",
        "dryRun=false",
        "",
        "# duration | cycles",
        "mode=duration",
        "",
        "# --- mode=duration ---",
        "# Total run time, then the session is terminated (loginctl).",
        "duration=1h",
        "# Random lock hold between min and max (hard limit: 30m).",
        "lockIntervalMin=10m",
        "lockIntervalMax=20m",
        "",
        "# --- mode=cycles ---",
        "# Locked hold in seconds.",
        "napTimeS=1800",
        "# Unlocked hold in seconds.",
        "weakTimeS=0.5",
        "# 0 = run until stopped.",
        "stopAfterCycles=0"
    };

    const std::string MOCK_XINPUT_LISTING =
        "⎡ Virtual core pointer                    \tid=2\t[master pointer  (3)]\n"
        "⎜   ↳ Virtual core XTEST pointer              \tid=4\t[slave  pointer  (2)]\n"
        "⎜   ↳ Logitech USB Mouse                       \tid=9\t[slave  pointer  (2)]\n"
        "⎣ Virtual core keyboard                   \tid=3\t[master keyboard (2)]\n"
        "    ↳ Virtual core XTEST keyboard             \tid=5\t[slave  keyboard (3)]\n"
        "    ↳ AT Translated Set 2 wired keyboard      \tid=10\t[slave  keyboard (3)]";

    const std::string MOCK_LOGINCTL_SESSIONS = "c54 103457 abennar seat0";
}
