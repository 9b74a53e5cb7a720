#include <chrono>
#include <string>
#include <cstdarg>
#include <stdio.h>
#include <systemd/sd-journal.h>
#include <syslog.h>
#include <ctime>

#include "logger.hpp"


#define INFO_PREPEND  "[INFO]"
#define WARN_PREPEND  "[WARN]"
#define ERR_PREPEND   "[ERROR]"
#define DEBUG_PREPEND "[DEBUG]"


Logger* Logger::getLoggerInst(void) {
    static Logger logInstance;
    return &logInstance;
}


void Logger::log(int logLvl, const char* format, ...) {
    if (logLvl == Logger::LOG_LVL_DEBUG && !m_DebugEnabled.load()) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    std::time_t currentTime = std::time(nullptr);
    std::tm localTime{};
    localtime_r(&currentTime, &localTime);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &localTime);

    int level = LOG_INFO;
    const char* prepend = INFO_PREPEND;

    switch (logLvl) {
        case Logger::LOG_LVL_INFO:
            level = LOG_INFO;
            prepend = INFO_PREPEND;
            break;

        case Logger::LOG_LVL_WARN:
            level = LOG_WARNING;
            prepend = WARN_PREPEND;
            break;

        case Logger::LOG_LVL_ERROR:
            level = LOG_ERR;
            prepend = ERR_PREPEND;
            break;

        case Logger::LOG_LVL_DEBUG:
            level = LOG_DEBUG;
            prepend = DEBUG_PREPEND;
            break;

        default:
            break;
    }

    std::string message = std::string(ts) + " " + prepend + " " + buffer;

    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_JournalEnabled.load()) {
        sd_journal_print(level, "%s", buffer);
    }
    printf("%s", message.c_str());
    fflush(stdout);
}
