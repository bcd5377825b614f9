/**
 * Trilobot v0.8 - Pacer
 *
 * Fixed-duration sleeps for the control loop. Every sleep is a
 * cancellation point: it returns early once shutdown is requested.
 */

#ifndef PACER_H
#define PACER_H

#include <atomic>
#include <cstdint>

class Pacer {
public:
    virtual ~Pacer() = default;

    /**
     * Sleep for ms milliseconds.
     * @return false if cancelled before or during the sleep
     */
    virtual bool sleepMs(uint32_t ms) = 0;

    /**
     * True once shutdown has been requested.
     */
    virtual bool cancelled() const = 0;
};

/**
 * Wall-clock pacer driven by the process shutdown flag.
 */
class SystemPacer : public Pacer {
public:
    explicit SystemPacer(const std::atomic<bool>& shutdown);

    bool sleepMs(uint32_t ms) override;
    bool cancelled() const override { return m_shutdown.load(); }

private:
    const std::atomic<bool>& m_shutdown;
};

#endif // PACER_H
