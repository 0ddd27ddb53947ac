// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#ifndef STRINGUTILS_HPP
#define STRINGUTILS_HPP

#include <string>
#include <vector>

namespace BerryUtils {
    /**
     * @brief Minden előfordulást lecserél a szövegben.
     */
    std::string replaceAll(std::string str, const std::string& from, const std::string& to);

    /**
     * @brief Whitespace eltávolítása a szöveg elejéről és végéről (config / secret tisztítás).
     */
    std::string trim(const std::string& s);

    /**
     * @brief Sorokra bontás; a '\r' végződést levágja, az üres sorokat megtartja.
     */
    std::vector<std::string> splitLines(const std::string& text);

    // Kis-nagybetű független részszöveg keresés (ASCII).
    bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

    std::string toLower(std::string s);

    std::string join(const std::vector<std::string>& parts, const std::string& sep);
}

#endif
