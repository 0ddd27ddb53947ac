// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// Lock / unlock action sequences

#ifndef LOCK_SEQUENCER_HPP
#define LOCK_SEQUENCER_HPP

#include "core/CommandExecutor.hpp"
#include <string>

namespace BerryUtils { class ILogger; }

namespace Berry::Core {

    class DetachedRunner;
    struct CycleTelemetry;

    /**
     * @brief Lock/Unlock Action Sequencer.
     * A megvárt lépések indítási hibája CommandError-ként továbbmegy.
     * A kijelző kikapcsolás detached: sosem várjuk meg, és sosem buktatja a ciklust.
     */
    class LockSequencer {
    public:
        LockSequencer(ICommandExecutor& executor, DetachedRunner& detached,
                      BerryUtils::ILogger& log, CycleTelemetry& telemetry);

        // Csak start()-kor
        void initialLock();

        // ft_lock, majd detached xset dpms force off
        void lockPhase();

        /**
         * @brief ft_lock, xdotool type <secret>, kijelző ki, xdotool key Return, kijelző ki.
         * A secret másolata a Command-ban a futás után nullázva.
         */
        void unlockPhase(const std::string& secret);

        void forceDisplayOff();

    private:
        ICommandExecutor& executor;
        DetachedRunner& detached;
        BerryUtils::ILogger& log;
        CycleTelemetry& telemetry;

        void runAwaited(const Command& cmd);
        void lockScreen();
    };
}

#endif
