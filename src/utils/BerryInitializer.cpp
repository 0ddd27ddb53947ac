// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "utils/BerryInitializer.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <pwd.h>
#include <unistd.h>

namespace Berry::Init {

    // A PATH marad: az ft_lock gyakran /usr/local/bin alatt lakik,
    // a DISPLAY/XAUTHORITY pedig kell az xdotool/xinput hívásokhoz.
    void purgeUnsafeEnvironment() {
        unsetenv("LD_PRELOAD");
        unsetenv("LD_LIBRARY_PATH");
        unsetenv("LD_AUDIT");
        unsetenv("PYTHONPATH");
        unsetenv("PYTHONHOME");
    }

    bool isRoot() {
        return geteuid() == 0;
    }

    std::string stateDirectory() {
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg && *xdg) {
            return std::string(xdg) + "/blueberry";
        }

        const char* home = std::getenv("HOME");
        if (!home || !*home) {
            struct passwd* pw = getpwuid(geteuid());
            if (pw && pw->pw_dir) {
                home = pw->pw_dir;
            }
        }
        if (!home || !*home) return "./.blueberry";
        return std::string(home) + "/.config/blueberry";
    }

    bool createSecureSkeleton() {
        const std::string path = stateDirectory();
        std::error_code ec;

        if (!std::filesystem::exists(path, ec)) {
            if (!std::filesystem::create_directories(path, ec)) {
                std::cerr << "[Init] Cannot create state directory " << path << ": " << ec.message() << std::endl;
                return false;
            }
        } else if (!std::filesystem::is_directory(path, ec)) {
            std::cerr << "[Init] " << path << " exists but is not a directory" << std::endl;
            return false;
        }

        // drwx------ : csak a tulajdonos látja a secret fájlt tartalmazó könyvtárat
        std::filesystem::permissions(path,
                                     std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            std::cerr << "[Init] Cannot restrict permissions on " << path << ": " << ec.message() << std::endl;
            return false;
        }
        return true;
    }
}
