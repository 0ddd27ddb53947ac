// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// Output channel + user notifications

#ifndef BERRY_LOGGER_HPP
#define BERRY_LOGGER_HPP

#include <mutex>
#include <string>

namespace BerryUtils {

    enum class LogLevel { DEBUG, INFO, WARN, ERROR };

    const char* logLevelName(LogLevel lvl);

    /**
     * @brief Notifier/Logger határfelület.
     * log(): a kimeneti csatorna (napló). notify(): a felhasználónak szóló értesítés.
     */
    class ILogger {
    public:
        virtual ~ILogger() = default;

        virtual void log(LogLevel lvl, const std::string& message) = 0;
        virtual void notify(LogLevel lvl, const std::string& message) = 0;

        void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
        void info(const std::string& m)  { log(LogLevel::INFO, m); }
        void warn(const std::string& m)  { log(LogLevel::WARN, m); }
        void error(const std::string& m) { log(LogLevel::ERROR, m); }
    };

    /**
     * @brief Konzol logger opcionális audit fájllal.
     * INFO/DEBUG -> stdout, WARN/ERROR -> stderr. A DEBUG csak verbose módban látszik.
     */
    class ConsoleLogger : public ILogger {
    public:
        explicit ConsoleLogger(bool verbose = false, std::string auditPath = "");

        void log(LogLevel lvl, const std::string& message) override;
        void notify(LogLevel lvl, const std::string& message) override;

        void setVerbose(bool v) { verbose = v; }

    private:
        bool verbose;
        std::string auditPath;
        std::mutex outputMutex;

        void appendAudit(LogLevel lvl, const std::string& message);
    };
}

#endif
