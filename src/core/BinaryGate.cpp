// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/BinaryGate.hpp"
#include "core/Programs.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Berry::Core {

    BinaryGate::BinaryGate(ICommandExecutor& exec, BerryUtils::ILogger& logger,
                           std::vector<std::string> names)
        : executor(exec), log(logger), required(std::move(names)) {}

    bool BinaryGate::isVerified() const {
        std::lock_guard<std::mutex> guard(lock);
        return verified;
    }

    bool BinaryGate::locate(const std::string& name) {
        try {
            std::string out = executor.capture(Command{Programs::WHICH, {name}});
            return !BerryUtils::trim(out).empty();
        } catch (const CommandError& e) {
            log.debug("[Gate] " + name + " not found: " + e.what());
            return false;
        }
    }

    BinaryReport BinaryGate::check(bool dryRun) {
        std::lock_guard<std::mutex> guard(lock);
        BinaryReport report;
        if (verified) {
            return report;
        }

        for (const auto& name : required) {
            bool present = locate(name);
            // Dry-run: a próba csak naplósor, a jelenlét feltételezett
            if (!present && !dryRun) {
                report.missing.push_back(name);
            }
        }
        report.allPresent = report.missing.empty();

        if (report.allPresent && !dryRun) {
            verified = true;
            log.debug("[Gate] All required binaries present.");
        } else if (!report.allPresent) {
            log.error("[Gate] Missing required binaries: " + BerryUtils::join(report.missing, ", "));
        }
        return report;
    }
}
