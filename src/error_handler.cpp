/**
 * Trilobot v0.8 - Error Handler Implementation
 */

#include "error_handler.h"
#include "logger.h"

#include <chrono>

static uint64_t now_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

ErrorHandler::ErrorHandler(uint32_t rate_limit_ms)
    : m_rate_limit_ms(rate_limit_ms)
{
}

void ErrorHandler::report(ErrorLevel level, const char* tag, const std::string& message) {
    switch (level) {
        case ErrorLevel::INFO:
            m_info_count++;
            break;
        case ErrorLevel::WARNING:
            m_warning_count++;
            break;
        case ErrorLevel::ERROR:
            m_error_count++;
            break;
        case ErrorLevel::CRITICAL:
            m_critical_count++;
            break;
    }

    uint64_t now = now_ms();
    if (m_logged_once && now - m_last_log_time_ms < m_rate_limit_ms &&
        level != ErrorLevel::CRITICAL) {
        m_suppressed_count++;
        m_suppressed_total++;
        return;
    }
    m_logged_once = true;
    m_last_log_time_ms = now;

    std::string text = message;
    if (m_suppressed_count > 0) {
        text += " (+" + std::to_string(m_suppressed_count) + " suppressed)";
        m_suppressed_count = 0;
    }

    switch (level) {
        case ErrorLevel::INFO:
            LOG_INFO(tag, "%s", text.c_str());
            break;
        case ErrorLevel::WARNING:
            LOG_WARN(tag, "%s", text.c_str());
            break;
        case ErrorLevel::ERROR:
            LOG_ERROR(tag, "%s", text.c_str());
            break;
        case ErrorLevel::CRITICAL:
            LOG_ERROR(tag, "CRITICAL: %s", text.c_str());
            break;
    }

    if (level == ErrorLevel::CRITICAL && m_critical_callback) {
        m_critical_callback(message);
    }
}

uint32_t ErrorHandler::getCount(ErrorLevel level) const {
    switch (level) {
        case ErrorLevel::INFO:     return m_info_count;
        case ErrorLevel::WARNING:  return m_warning_count;
        case ErrorLevel::ERROR:    return m_error_count;
        case ErrorLevel::CRITICAL: return m_critical_count;
    }
    return 0;
}

void ErrorHandler::clearCounts() {
    m_info_count = 0;
    m_warning_count = 0;
    m_error_count = 0;
    m_critical_count = 0;
    m_suppressed_count = 0;
    m_suppressed_total = 0;
}
