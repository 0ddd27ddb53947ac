// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/LockSequencer.hpp"
#include "core/DetachedRunner.hpp"
#include "core/Programs.hpp"
#include "core/SecretStore.hpp"
#include "telemetry/CycleTelemetry.hpp"
#include "utils/Logger.hpp"

namespace Berry::Core {

    LockSequencer::LockSequencer(ICommandExecutor& exec, DetachedRunner& runner,
                                 BerryUtils::ILogger& logger, CycleTelemetry& stats)
        : executor(exec), detached(runner), log(logger), telemetry(stats) {}

    void LockSequencer::runAwaited(const Command& cmd) {
        int code = executor.run(cmd);
        if (code != 0) {
            log.warn("[Sequencer] " + cmd.render() + " exited with code " + std::to_string(code));
        }
    }

    void LockSequencer::lockScreen() {
        runAwaited(Command{Programs::LOCK, {}});
        telemetry.locks++;
    }

    void LockSequencer::initialLock() {
        log.info("[Sequencer] Initial lock");
        lockScreen();
    }

    void LockSequencer::lockPhase() {
        log.debug("[Sequencer] Lock phase");
        lockScreen();
        forceDisplayOff();
    }

    void LockSequencer::unlockPhase(const std::string& secret) {
        log.debug("[Sequencer] Unlock phase");

        // Re-trigger: a zárképernyő biztosan előtérben legyen a gépelés előtt
        runAwaited(Command{Programs::LOCK, {}});

        Command type{Programs::XDOTOOL, {"type", secret}, true};
        try {
            runAwaited(type);
        } catch (...) {
            wipeSecret(type.args.back());
            throw;
        }
        wipeSecret(type.args.back());

        forceDisplayOff();
        runAwaited(Command{Programs::XDOTOOL, {"key", "Return"}});
        forceDisplayOff();

        telemetry.unlocks++;
    }

    void LockSequencer::forceDisplayOff() {
        ICommandExecutor& exec = executor;
        detached.post("xset dpms force off", [&exec]() {
            Command cmd{Programs::XSET, {"dpms", "force", "off"}};
            int code = exec.run(cmd);
            if (code != 0) {
                throw CommandError(cmd.render() + " exited with code " + std::to_string(code));
            }
        });
    }
}
