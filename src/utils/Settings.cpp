// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "utils/Settings.hpp"
#include "utils/BerryInitializer.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace BerryUtils {

    const char* scheduleModeName(ScheduleMode mode) {
        return mode == ScheduleMode::CycleCount ? "cycles" : "duration";
    }

    namespace {
        bool parseBool(const std::string& value, bool& out) {
            const std::string v = toLower(value);
            if (v == "true" || v == "1" || v == "yes" || v == "on") { out = true; return true; }
            if (v == "false" || v == "0" || v == "no" || v == "off") { out = false; return true; }
            return false;
        }

        bool parseNumber(const std::string& value, double& out) {
            try {
                size_t used = 0;
                double d = std::stod(value, &used);
                if (used != value.size() || !std::isfinite(d)) return false;
                out = d;
                return true;
            } catch (const std::logic_error&) {
                return false;
            }
        }

        bool parseCount(const std::string& value, unsigned& out) {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) return false;
            try {
                unsigned long n = std::stoul(value);
                if (n > 1000000000UL) return false;
                out = static_cast<unsigned>(n);
                return true;
            } catch (const std::logic_error&) {
                return false;
            }
        }
    }

    Settings parseSettings(const std::vector<std::string>& lines, ILogger* log) {
        Settings s;

        auto invalid = [log](const std::string& key, const std::string& value) {
            if (log) log->warn("[Config] Invalid value for " + key + ": \"" + value + "\", using default.");
        };

        for (const auto& raw : lines) {
            const std::string line = trim(raw);
            // Kommentek és üres sorok kihagyása
            if (line.empty() || line[0] == '#') continue;

            size_t pos = line.find('=');
            if (pos == std::string::npos) {
                if (log) log->warn("[Config] Ignoring malformed line: " + line);
                continue;
            }
            const std::string key = trim(line.substr(0, pos));
            const std::string value = trim(line.substr(pos + 1));

            if (key == "dryRun") {
                if (!parseBool(value, s.dryRun)) invalid(key, value);
            } else if (key == "mode") {
                const std::string m = toLower(value);
                if (m == "duration") s.mode = ScheduleMode::Duration;
                else if (m == "cycles") s.mode = ScheduleMode::CycleCount;
                else invalid(key, value);
            } else if (key == "duration") {
                s.duration = value;
            } else if (key == "lockIntervalMin") {
                s.lockIntervalMin = value;
            } else if (key == "lockIntervalMax") {
                s.lockIntervalMax = value;
            } else if (key == "napTimeS") {
                if (!parseNumber(value, s.napTimeS)) invalid(key, value);
            } else if (key == "weakTimeS") {
                if (!parseNumber(value, s.weakTimeS)) invalid(key, value);
            } else if (key == "stopAfterCycles") {
                if (!parseCount(value, s.stopAfterCycles)) invalid(key, value);
            } else if (log) {
                log->warn("[Config] Unknown key ignored: " + key);
            }
        }
        return s;
    }

    FileConfigSource::FileConfigSource(std::string configPath, ILogger* logger)
        : path(std::move(configPath)), log(logger) {}

    Settings FileConfigSource::load() {
        std::vector<std::string> lines;
        std::ifstream file(path);
        if (file.is_open()) {
            std::string line;
            while (std::getline(file, line)) lines.push_back(line);
        } else if (log) {
            log->debug("[Config] " + path + " not readable, using defaults.");
        }

        Settings s = parseSettings(lines, log);
        if (forcedDryRun) s.dryRun = true;
        return s;
    }

    std::string defaultConfigPath() {
        return Berry::Init::stateDirectory() + "/blueberry.conf";
    }
}
