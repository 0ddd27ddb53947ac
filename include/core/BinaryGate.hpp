// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#ifndef BINARY_GATE_HPP
#define BINARY_GATE_HPP

#include "core/CommandExecutor.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace BerryUtils { class ILogger; }

namespace Berry::Core {

    struct BinaryReport {
        bool allPresent = true;
        std::vector<std::string> missing;
    };

    /**
     * @brief Binary Availability Gate.
     * "which <név>" próbával ellenőrzi a kötelező programokat. Az első sikeres valódi
     * ellenőrzés eredménye a folyamat élettartamára gyorsítótárazva marad.
     * Dry-run módban a jelenlét feltételezett, és ez NEM kerül a gyorsítótárba.
     */
    class BinaryGate {
    public:
        BinaryGate(ICommandExecutor& executor, BerryUtils::ILogger& log,
                   std::vector<std::string> required);

        BinaryReport check(bool dryRun);

        bool isVerified() const;

    private:
        ICommandExecutor& executor;
        BerryUtils::ILogger& log;
        std::vector<std::string> required;

        mutable std::mutex lock;
        bool verified = false;

        bool locate(const std::string& name);
    };
}

#endif
