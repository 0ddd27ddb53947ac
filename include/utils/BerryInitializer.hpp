// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#ifndef BERRY_INITIALIZER_HPP
#define BERRY_INITIALIZER_HPP

#include <string>

namespace Berry::Init {
    /**
     * @brief Root alatt futunk-e. A ciklus a felhasználó saját X munkamenetét vezérli.
     */
    bool isRoot();

    /**
     * @brief Állapotkönyvtár: $XDG_CONFIG_HOME/blueberry vagy ~/.config/blueberry.
     */
    std::string stateDirectory();

    /**
     * @brief Létrehozza az állapotkönyvtárat szigorú (0700) jogosultsággal.
     */
    bool createSecureSkeleton();

    /**
     * @brief Kódinjekcióra alkalmas környezeti változók törlése (a gyerekfolyamatok öröklik).
     */
    void purgeUnsafeEnvironment();
}

#endif
