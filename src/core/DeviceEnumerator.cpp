// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/DeviceEnumerator.hpp"
#include "core/Programs.hpp"
#include "telemetry/CycleTelemetry.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <regex>

namespace Berry::Core {

    namespace {
        // xinput két szóközzel írja: "[slave  keyboard (3)]"
        const char* const SLAVE_KEYBOARD = "slave  keyboard";
        const char* const WIRED_KEYBOARD = "wired keyboard";
        const char* const SLAVE_POINTER  = "slave  pointer";
        const char* const MOUSE          = "mouse";

        template <typename Pred>
        std::vector<int> extractIds(const std::string& listing, Pred matches) {
            static const std::regex idToken(R"(id=(\d+))");
            std::vector<int> ids;
            for (const auto& line : BerryUtils::splitLines(listing)) {
                if (!matches(line)) continue;
                std::smatch m;
                if (std::regex_search(line, m, idToken)) {
                    try {
                        ids.push_back(std::stoi(m[1].str()));
                    } catch (const std::out_of_range&) {
                        // túl hosszú id: nem valódi xinput sor
                    }
                }
            }
            return ids;
        }
    }

    std::vector<InputDevice> DeviceSet::all() const {
        std::vector<InputDevice> out;
        for (int id : mice) out.push_back({id, DeviceClass::Pointer});
        for (int id : keyboards) out.push_back({id, DeviceClass::Keyboard});
        return out;
    }

    std::vector<int> parseKeyboardIds(const std::string& listing) {
        return extractIds(listing, [](const std::string& line) {
            return line.find(SLAVE_KEYBOARD) != std::string::npos &&
                   line.find(WIRED_KEYBOARD) != std::string::npos;
        });
    }

    std::vector<int> parseMouseIds(const std::string& listing) {
        return extractIds(listing, [](const std::string& line) {
            return line.find(SLAVE_POINTER) != std::string::npos &&
                   BerryUtils::containsIgnoreCase(line, MOUSE);
        });
    }

    DeviceEnumerator::DeviceEnumerator(ICommandExecutor& exec, BerryUtils::ILogger& logger,
                                       CycleTelemetry* stats)
        : executor(exec), log(logger), telemetry(stats) {}

    bool DeviceEnumerator::listDevices(std::string& out, const char* what) {
        try {
            out = executor.capture(Command{Programs::XINPUT, {"list"}});
            return true;
        } catch (const CommandError& e) {
            log.error(std::string("[Devices] Error getting ") + what + " IDs: " + e.what());
            if (telemetry) telemetry->enumeration_failures++;
            return false;
        }
    }

    std::vector<int> DeviceEnumerator::mouseIds() {
        std::string listing;
        if (!listDevices(listing, "mouse")) return {};
        return parseMouseIds(listing);
    }

    std::vector<int> DeviceEnumerator::keyboardIds() {
        std::string listing;
        if (!listDevices(listing, "keyboard")) return {};
        return parseKeyboardIds(listing);
    }

    DeviceSet DeviceEnumerator::enumerate() {
        DeviceSet set;
        set.mice = mouseIds();
        set.keyboards = keyboardIds();
        return set;
    }
}
