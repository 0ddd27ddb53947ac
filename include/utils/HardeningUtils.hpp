// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#ifndef HARDENINGUTILS_HPP
#define HARDENINGUTILS_HPP

#include <string>
#include <vector>
#include <sys/types.h>

namespace BerryUtils {
    // Atomikus írás: mkostemp + fchmod(mode) + fsync + rename.
    bool atomicWriteFile(const std::string& path, const std::string& data, mode_t mode);

    // Sorok kiírása 0600-as fájlba. Meglévő fájlt nem ír felül.
    bool writeProtectedFile(const std::string& path, const std::vector<std::string>& content);

    /**
     * @brief Tulajdonos = effektív user, és nincs group/other jog.
     * Hiányzó fájl esetén allowMissing dönt.
     */
    bool checkOwnershipAndPerms(const std::string& path, bool allowMissing);

    // Nullákkal felülírás, majd törlés. Symlinket és idegen tulajdonú fájlt nem bánt.
    bool secureDeleteFile(const std::string& path);
}

#endif
