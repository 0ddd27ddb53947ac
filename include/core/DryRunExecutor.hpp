// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// Dry-run projection over every external effect

#ifndef DRY_RUN_EXECUTOR_HPP
#define DRY_RUN_EXECUTOR_HPP

#include "core/CommandExecutor.hpp"
#include <atomic>

namespace BerryUtils { class ILogger; }

namespace Berry::Core {

    /**
     * @brief Dekorátor: dry-run módban a hívás helyett "Would execute: ..." naplósor,
     * és ahol a valódi hívásnak kimenete van, determinisztikus mock kimenet.
     * A vezérlési döntéseket nem változtatja meg. A kapcsolót ciklusonként frissítjük.
     */
    class DryRunExecutor : public ICommandExecutor {
    public:
        DryRunExecutor(ICommandExecutor& real, BerryUtils::ILogger& log);

        void setEnabled(bool on) { enabled.store(on); }
        bool isEnabled() const { return enabled.load(); }

        int run(const Command& cmd) override;
        std::string capture(const Command& cmd) override;

        // A mock kimenet a megadott parancsra (xinput list, loginctl list-sessions --no-legend)
        static std::string mockOutput(const Command& cmd);

    private:
        ICommandExecutor& real;
        BerryUtils::ILogger& log;
        std::atomic<bool> enabled{false};

        void logCommand(const Command& cmd);
    };
}

#endif
