// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// Duration strings ("1h", "30m", "1.5s") and lock interval policy

#ifndef DURATION_PARSER_HPP
#define DURATION_PARSER_HPP

#include <chrono>
#include <string>

namespace BerryUtils {

    class ILogger;

    // Hibás formátum esetén visszaadott érték: 1 óra.
    constexpr std::chrono::milliseconds FALLBACK_DURATION{60 * 60 * 1000};

    // Kemény biztonsági plafon a zárolási intervallumokra.
    constexpr std::chrono::milliseconds MAX_LOCK_INTERVAL{30 * 60 * 1000};

    /**
     * @brief "<szám><h|m|s>" formátum -> milliszekundum.
     * Sosem dob kivételt: hibás bemenetnél hibát naplóz (ha van logger) és FALLBACK_DURATION-t ad.
     */
    std::chrono::milliseconds parseDuration(const std::string& text, ILogger* log = nullptr);

    enum class IntervalViolation {
        None,
        MinExceedsCeiling,
        MaxExceedsCeiling,
        MinGreaterThanMax
    };

    struct IntervalCheck {
        bool valid = true;
        IntervalViolation violation = IntervalViolation::None;
        std::string reason;
    };

    /**
     * @brief min <= max <= plafon ellenőrzés, a sértés pontos okával.
     */
    IntervalCheck validateLockIntervals(std::chrono::milliseconds minMs,
                                        std::chrono::milliseconds maxMs,
                                        std::chrono::milliseconds ceiling = MAX_LOCK_INTERVAL);

    /**
     * @brief Egyenletes eloszlású húzás [min, max] között (inkluzív).
     * min == max esetén pontosan min, véletlen nélkül.
     * @throws std::invalid_argument ha min > max vagy a tartomány nem fér 32 bitbe.
     */
    std::chrono::milliseconds drawLockInterval(std::chrono::milliseconds minMs,
                                               std::chrono::milliseconds maxMs);

    // Cycle-count mód tartási idejeinek felső határa (másodperc).
    constexpr double MAX_HOLD_SECONDS = 24.0 * 60.0 * 60.0;
    constexpr std::chrono::milliseconds MAX_HOLD{24 * 60 * 60 * 1000};

    // Másodperc (tört is) -> ms, cycle-count módhoz. MAX_HOLD-nál telítődik.
    std::chrono::milliseconds secondsToMillis(double seconds);
}

#endif
