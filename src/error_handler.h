/**
 * Trilobot v0.8 - Error Handler
 */

#ifndef ERROR_HANDLER_H
#define ERROR_HANDLER_H

#include <cstdint>
#include <functional>
#include <string>

/**
 * Error severity levels
 */
enum class ErrorLevel {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * ErrorHandler - Centralized error reporting and safety escalation
 *
 * - Per-level counters
 * - Rate-limited logging (CRITICAL is never suppressed)
 * - CRITICAL errors invoke the critical callback (safety stop)
 */
class ErrorHandler {
public:
    using CriticalCallback = std::function<void(const std::string& message)>;

    explicit ErrorHandler(uint32_t rate_limit_ms = 100);

    /**
     * Report an error from tag (module name).
     */
    void report(ErrorLevel level, const char* tag, const std::string& message);

    uint32_t getCount(ErrorLevel level) const;
    uint32_t getSuppressedCount() const { return m_suppressed_total; }

    void clearCounts();

    void setCriticalCallback(CriticalCallback callback) { m_critical_callback = callback; }

private:
    uint32_t m_rate_limit_ms;

    uint32_t m_info_count = 0;
    uint32_t m_warning_count = 0;
    uint32_t m_error_count = 0;
    uint32_t m_critical_count = 0;

    bool m_logged_once = false;
    uint64_t m_last_log_time_ms = 0;
    uint32_t m_suppressed_count = 0;
    uint32_t m_suppressed_total = 0;

    CriticalCallback m_critical_callback;
};

#endif // ERROR_HANDLER_H
