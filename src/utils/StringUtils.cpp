// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace BerryUtils {
    std::string replaceAll(std::string str, const std::string& from, const std::string& to) {
        if(from.empty()) return str;
        size_t start_pos = 0;
        while((start_pos = str.find(from, start_pos)) != std::string::npos) {
            str.replace(start_pos, from.length(), to);
            start_pos += to.length();
        }
        return str;
    }

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n\f\v";
        auto first = s.find_first_not_of(ws);
        if (first == std::string::npos) return "";
        auto last = s.find_last_not_of(ws);
        return s.substr(first, last - first + 1);
    }

    std::vector<std::string> splitLines(const std::string& text) {
        std::vector<std::string> lines;
        std::istringstream iss(text);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(line);
        }
        return lines;
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
        return toLower(haystack).find(toLower(needle)) != std::string::npos;
    }

    std::string join(const std::vector<std::string>& parts, const std::string& sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += sep;
            out += parts[i];
        }
        return out;
    }
}
