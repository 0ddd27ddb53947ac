// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// Configuration Source: typed settings with defaults

#ifndef BERRY_SETTINGS_HPP
#define BERRY_SETTINGS_HPP

#include <string>
#include <vector>

namespace BerryUtils {

    class ILogger;

    enum class ScheduleMode {
        Duration,   // teljes futási idő + véletlen zárolási intervallum
        CycleCount  // fix nap/weak idők, opcionális ciklusszám-korlát
    };

    const char* scheduleModeName(ScheduleMode mode);

    struct Settings {
        bool dryRun = false;
        ScheduleMode mode = ScheduleMode::Duration;

        // --- mode=duration ---
        std::string duration = "1h";
        std::string lockIntervalMin = "10m";
        std::string lockIntervalMax = "20m";

        // --- mode=cycles ---
        double napTimeS = 1800.0;
        double weakTimeS = 0.5;
        unsigned stopAfterCycles = 0; // 0 = korlátlan
    };

    /**
     * @brief Beállítás-forrás. Minden load() friss olvasás, nincs gyorsítótár.
     */
    class IConfigSource {
    public:
        virtual ~IConfigSource() = default;
        virtual Settings load() = 0;
    };

    /**
     * @brief "key=value" sorok értelmezése (a '#' kezdetű és üres sorok kimaradnak).
     * Ismeretlen kulcs vagy hibás érték: figyelmeztetés, az alapértelmezés marad.
     */
    Settings parseSettings(const std::vector<std::string>& lines, ILogger* log = nullptr);

    /**
     * @brief A blueberry.conf fájl, minden hívásnál újraolvasva.
     * Hiányzó fájl = alapértelmezett beállítások.
     */
    class FileConfigSource : public IConfigSource {
    public:
        explicit FileConfigSource(std::string path, ILogger* log = nullptr);

        Settings load() override;

        // --dry-run kapcsoló: minden olvasás után dryRun=true
        void forceDryRun(bool force) { forcedDryRun = force; }

        const std::string& getPath() const { return path; }

    private:
        std::string path;
        ILogger* log;
        bool forcedDryRun = false;
    };

    // $XDG_CONFIG_HOME/blueberry/blueberry.conf, különben ~/.config/blueberry/blueberry.conf
    std::string defaultConfigPath();
}

#endif
