// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "utils/DurationParser.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <sodium.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <regex>
#include <stdexcept>

namespace BerryUtils {

    std::chrono::milliseconds parseDuration(const std::string& text, ILogger* log) {
        static const std::regex pattern(R"(^(\d+(?:\.\d*)?|\.\d+)([hms])$)", std::regex::icase);

        std::smatch match;
        const std::string candidate = trim(text);
        if (!std::regex_match(candidate, match, pattern)) {
            if (log) {
                log->error("Invalid duration format: \"" + text + "\". Using default 1 hour.");
            }
            return FALLBACK_DURATION;
        }

        double value = 0.0;
        try {
            value = std::stod(match[1].str());
        } catch (const std::out_of_range&) {
            if (log) {
                log->error("Duration out of range: \"" + text + "\". Using default 1 hour.");
            }
            return FALLBACK_DURATION;
        }

        double factor = 0.0;
        switch (std::tolower(static_cast<unsigned char>(match[2].str()[0]))) {
            case 'h': factor = 60.0 * 60.0 * 1000.0; break;
            case 'm': factor = 60.0 * 1000.0; break;
            default:  factor = 1000.0; break;
        }

        const double ms = value * factor;
        if (!std::isfinite(ms) || ms > static_cast<double>(std::numeric_limits<int64_t>::max() / 2)) {
            if (log) {
                log->error("Duration out of range: \"" + text + "\". Using default 1 hour.");
            }
            return FALLBACK_DURATION;
        }
        return std::chrono::milliseconds(std::llround(ms));
    }

    IntervalCheck validateLockIntervals(std::chrono::milliseconds minMs,
                                        std::chrono::milliseconds maxMs,
                                        std::chrono::milliseconds ceiling) {
        IntervalCheck check;
        const auto ceilingMinutes = std::to_string(ceiling.count() / 60000);

        if (minMs > ceiling) {
            check.valid = false;
            check.violation = IntervalViolation::MinExceedsCeiling;
            check.reason = "Minimum lock interval exceeds " + ceilingMinutes + " minutes limit";
        } else if (maxMs > ceiling) {
            check.valid = false;
            check.violation = IntervalViolation::MaxExceedsCeiling;
            check.reason = "Maximum lock interval exceeds " + ceilingMinutes + " minutes limit";
        } else if (minMs > maxMs) {
            check.valid = false;
            check.violation = IntervalViolation::MinGreaterThanMax;
            check.reason = "Minimum lock interval (" + std::to_string(minMs.count()) +
                           "ms) cannot be greater than maximum (" + std::to_string(maxMs.count()) + "ms)";
        }
        return check;
    }

    std::chrono::milliseconds drawLockInterval(std::chrono::milliseconds minMs,
                                               std::chrono::milliseconds maxMs) {
        if (minMs == maxMs) {
            return minMs;
        }
        if (minMs > maxMs) {
            throw std::invalid_argument("drawLockInterval: min > max");
        }

        const auto span = static_cast<uint64_t>((maxMs - minMs).count());
        if (span >= std::numeric_limits<uint32_t>::max()) {
            throw std::invalid_argument("drawLockInterval: range too large");
        }
        if (sodium_init() < 0) {
            throw std::runtime_error("drawLockInterval: sodium_init failed");
        }

        // randombytes_uniform: [0, upper) -> +1 az inkluzív felső határért
        const uint32_t offset = randombytes_uniform(static_cast<uint32_t>(span + 1));
        return minMs + std::chrono::milliseconds(offset);
    }

    std::chrono::milliseconds secondsToMillis(double seconds) {
        if (std::isnan(seconds) || seconds <= 0.0) {
            return std::chrono::milliseconds(0);
        }
        const double ms = seconds * 1000.0;
        if (ms >= static_cast<double>(MAX_HOLD.count())) {
            return MAX_HOLD;
        }
        return std::chrono::milliseconds(std::llround(ms));
    }
}
