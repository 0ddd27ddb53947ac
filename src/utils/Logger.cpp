// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <cstdio>
#include <ctime>
#include <iostream>
#include <sys/stat.h>

namespace BerryUtils {

    const char* logLevelName(LogLevel lvl) {
        switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        }
        return "UNKNOWN";
    }

    ConsoleLogger::ConsoleLogger(bool verboseMode, std::string auditFile)
        : verbose(verboseMode), auditPath(std::move(auditFile)) {}

    void ConsoleLogger::log(LogLevel lvl, const std::string& message) {
        std::lock_guard<std::mutex> guard(outputMutex);

        if (lvl == LogLevel::DEBUG && !verbose) {
            appendAudit(lvl, message);
            return;
        }

        if (lvl == LogLevel::WARN || lvl == LogLevel::ERROR) {
            std::cerr << "[" << logLevelName(lvl) << "] " << message << std::endl;
        } else {
            std::cout << message << std::endl;
        }
        appendAudit(lvl, message);
    }

    void ConsoleLogger::notify(LogLevel lvl, const std::string& message) {
        std::lock_guard<std::mutex> guard(outputMutex);
        auto& out = (lvl == LogLevel::ERROR) ? std::cerr : std::cout;
        out << "\n[!] " << message << " [!]\n" << std::endl;
        appendAudit(lvl, "notify: " + message);
    }

    // timestamp | level | message, egy sor bejegyzésenként
    void ConsoleLogger::appendAudit(LogLevel lvl, const std::string& message) {
        if (auditPath.empty()) return;

        FILE* f = std::fopen(auditPath.c_str(), "a");
        if (!f) {
            std::fprintf(stderr, "[audit-fail] %s: %s\n", logLevelName(lvl), message.c_str());
            return;
        }
        fchmod(fileno(f), S_IRUSR | S_IWUSR);

        std::time_t t = std::time(nullptr);
        std::tm tm{};
        localtime_r(&t, &tm);
        char tbuf[64];
        if (std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
            tbuf[0] = '\0';
        }

        std::string clean = replaceAll(replaceAll(message, "\r", " "), "\n", " ");
        std::fprintf(f, "%s | %s | %s\n", tbuf, logLevelName(lvl), clean.c_str());
        std::fclose(f);
    }
}
