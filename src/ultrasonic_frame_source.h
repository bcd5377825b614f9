/**
 * Trilobot v0.8 - Ultrasonic Frame Source
 *
 * Legacy single-beam ranger presented as a 1x1 frame, so the zone
 * pipeline runs unchanged with all three zones set to (0,0)-(0,0).
 * Distances are in cm.
 */

#ifndef ULTRASONIC_FRAME_SOURCE_H
#define ULTRASONIC_FRAME_SOURCE_H

#include <cstdint>

#include "frame_source.h"
#include "pacer.h"

/**
 * Single-beam ranger. Negative readings mean no valid echo.
 */
class RangeFinder {
public:
    virtual ~RangeFinder() = default;
    virtual float readDistance(uint32_t timeout_ms, int samples) = 0;
};

class UltrasonicFrameSource : public FrameSource {
public:
    struct Profile {
        int readings = 10;            // valid readings averaged per frame
        int samples = 3;              // echoes the ranger averages per reading
        uint32_t timeout_ms = 25;
        uint32_t reading_gap_ms = 10;
        int retry_max = 10;           // attempts per reading before giving up
    };

    UltrasonicFrameSource(RangeFinder& ranger, Pacer& pacer, const Profile& profile);

    bool init() override;
    FrameStatus nextFrame(DistanceFrame& out) override;
    void shutdown() override {}

    const Profile& getProfile() const { return m_profile; }

private:
    FrameStatus readValid(float& distance);

    RangeFinder& m_ranger;
    Pacer& m_pacer;
    Profile m_profile;
};

#endif // ULTRASONIC_FRAME_SOURCE_H
