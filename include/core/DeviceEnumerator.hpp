// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// Input device discovery over "xinput list"

#ifndef DEVICE_ENUMERATOR_HPP
#define DEVICE_ENUMERATOR_HPP

#include "core/CommandExecutor.hpp"
#include <string>
#include <vector>

namespace BerryUtils { class ILogger; }

namespace Berry::Core {

    struct CycleTelemetry;

    enum class DeviceClass { Pointer, Keyboard };

    struct InputDevice {
        int id;
        DeviceClass cls;
    };

    // Egy ciklus eszközlistája; minden ciklus elején újra lekérdezve (hot-plug).
    struct DeviceSet {
        std::vector<int> mice;
        std::vector<int> keyboards;

        std::vector<InputDevice> all() const;
    };

    /**
     * @brief Vezetékes billentyűzet sorok: "slave  keyboard" + "wired keyboard".
     * @return az id-k a listázás sorrendjében
     */
    std::vector<int> parseKeyboardIds(const std::string& listing);

    /**
     * @brief Egér sorok: "slave  pointer" + "mouse" (kis-nagybetű független).
     */
    std::vector<int> parseMouseIds(const std::string& listing);

    class DeviceEnumerator {
    public:
        DeviceEnumerator(ICommandExecutor& executor, BerryUtils::ILogger& log,
                         CycleTelemetry* telemetry = nullptr);

        // Hiba esetén üres lista: "nincs eszköz", nem végzetes.
        std::vector<int> mouseIds();
        std::vector<int> keyboardIds();

        DeviceSet enumerate();

    private:
        ICommandExecutor& executor;
        BerryUtils::ILogger& log;
        CycleTelemetry* telemetry;

        bool listDevices(std::string& out, const char* what);
    };
}

#endif
