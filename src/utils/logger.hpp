#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <atomic>
#include <cstdarg>
#include <mutex>


class Logger {
public:
    Logger() {}
    ~Logger() {}

    static Logger* getLoggerInst(void);
    void log(int logLvl, const char* format, ...);

    /**
     * @brief Enable or disable debug output
     *
     * @param enabled true to emit LOG_LVL_DEBUG messages
     */
    void setDebug(bool enabled) {
        m_DebugEnabled.store(enabled);
    }

    bool isDebugEnabled() const {
        return m_DebugEnabled.load();
    }

    /**
     * @brief Enable or disable forwarding to the systemd journal
     *
     * @param enabled true to forward each line to sd_journal_print
     */
    void setJournal(bool enabled) {
        m_JournalEnabled.store(enabled);
    }
public:
    enum {
        LOG_LVL_INFO,
        LOG_LVL_WARN,
        LOG_LVL_ERROR,
        LOG_LVL_DEBUG
    };

private:
    std::mutex m_Mutex;
    std::atomic<bool> m_DebugEnabled{false};
    std::atomic<bool> m_JournalEnabled{true};
};

#endif
