/**
 * Trilobot v0.8 - Ultrasonic Frame Source Implementation
 */

#include "ultrasonic_frame_source.h"
#include "logger.h"

extern "C" {
#include "tofbot_limits.h"
}

static const char* TAG = "Sonar";

UltrasonicFrameSource::UltrasonicFrameSource(RangeFinder& ranger, Pacer& pacer,
                                             const Profile& profile)
    : m_ranger(ranger)
    , m_pacer(pacer)
    , m_profile(profile)
{
}

bool UltrasonicFrameSource::init() {
    if (m_profile.readings <= 0 || m_profile.retry_max <= 0) {
        LOG_ERROR(TAG, "Invalid profile: readings=%d, retry_max=%d",
                  m_profile.readings, m_profile.retry_max);
        return false;
    }
    LOG_INFO(TAG, "Averaging %d readings, %d attempts each",
             m_profile.readings, m_profile.retry_max);
    return true;
}

FrameStatus UltrasonicFrameSource::readValid(float& distance) {
    for (int attempt = 1; attempt <= m_profile.retry_max; attempt++) {
        float d = m_ranger.readDistance(m_profile.timeout_ms, m_profile.samples);
        if (d >= 0.0f) {
            distance = d;
            return FrameStatus::OK;
        }
        LOG_DEBUG(TAG, "Invalid reading (attempt %d/%d)", attempt, m_profile.retry_max);
        if (m_pacer.cancelled()) {
            return FrameStatus::CANCELLED;
        }
    }

    LOG_ERROR(TAG, "Unable to get a valid distance reading after %d attempts",
              m_profile.retry_max);
    return FrameStatus::SENSOR_FAILURE;
}

FrameStatus UltrasonicFrameSource::nextFrame(DistanceFrame& out) {
    double total_cm = 0.0;

    for (int i = 0; i < m_profile.readings; i++) {
        float distance = 0.0f;
        FrameStatus status = readValid(distance);
        if (status != FrameStatus::OK) {
            return status;
        }
        total_cm += distance;

        if (!m_pacer.sleepMs(m_profile.reading_gap_ms)) {
            return FrameStatus::CANCELLED;
        }
    }

    DistanceFrame frame(FRAME_DIM_ULTRASONIC, FRAME_DIM_ULTRASONIC);
    frame.set(0, 0, static_cast<uint32_t>(total_cm / m_profile.readings));

    LOG_DEBUG(TAG, "Average distance %u cm", frame.at(0, 0));

    out = frame;
    return FrameStatus::OK;
}
