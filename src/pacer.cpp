/**
 * Trilobot v0.8 - Pacer Implementation
 */

#include "pacer.h"

#include <unistd.h>

extern "C" {
#include "tofbot_limits.h"
}

SystemPacer::SystemPacer(const std::atomic<bool>& shutdown)
    : m_shutdown(shutdown)
{
}

bool SystemPacer::sleepMs(uint32_t ms) {
    uint32_t remaining = ms;
    while (remaining > 0) {
        if (m_shutdown.load()) return false;

        uint32_t slice = remaining < PACER_SLICE_MS ? remaining : PACER_SLICE_MS;
        usleep(slice * 1000);
        remaining -= slice;
    }
    return !m_shutdown.load();
}
