/**
 * Trilobot v0.8 - ToF Frame Source Implementation
 */

#include "sensor_frame_source.h"
#include "logger.h"

extern "C" {
#include "tofbot_limits.h"
}

static const char* TAG = "ToF";

const char* frameStatusToString(FrameStatus status) {
    switch (status) {
        case FrameStatus::OK:             return "OK";
        case FrameStatus::SENSOR_FAILURE: return "SENSOR_FAILURE";
        case FrameStatus::CANCELLED:      return "CANCELLED";
    }
    return "UNKNOWN";
}

SensorFrameSource::SensorFrameSource(RangingSensor& sensor, Pacer& pacer,
                                     const SensorSettings& settings, uint32_t ready_wait_ms)
    : m_sensor(sensor)
    , m_pacer(pacer)
    , m_settings(settings)
    , m_ready_wait_ms(ready_wait_ms)
    , m_ranging(false)
{
}

SensorFrameSource::~SensorFrameSource() {
    shutdown();
}

int SensorFrameSource::expectedDim(int resolution) {
    return resolution == 16 ? 4 : FRAME_DIM_TOF;
}

bool SensorFrameSource::init() {
    LOG_INFO(TAG, "Configuring: %d zones, %d Hz, integration %d ms, sharpener %d%%",
             m_settings.resolution, m_settings.ranging_frequency_hz,
             m_settings.integration_time_ms, m_settings.sharpener_percent);

    if (!m_sensor.configure(m_settings)) {
        LOG_ERROR(TAG, "Sensor configuration failed");
        return false;
    }

    if (!m_sensor.startRanging()) {
        LOG_ERROR(TAG, "Failed to start ranging");
        return false;
    }

    m_ranging = true;
    LOG_INFO(TAG, "Ranging started");
    return true;
}

FrameStatus SensorFrameSource::nextFrame(DistanceFrame& out) {
    if (!m_ranging) {
        LOG_ERROR(TAG, "nextFrame() before init()");
        return FrameStatus::SENSOR_FAILURE;
    }

    uint32_t waited_ms = 0;
    while (!m_sensor.isFrameReady()) {
        if (waited_ms >= m_ready_wait_ms) {
            LOG_ERROR(TAG, "No frame after %u ms", waited_ms);
            return FrameStatus::SENSOR_FAILURE;
        }
        if (!m_pacer.sleepMs(SENSOR_READY_POLL_MS)) {
            return FrameStatus::CANCELLED;
        }
        waited_ms += SENSOR_READY_POLL_MS;
    }

    DistanceFrame frame;
    if (!m_sensor.getFrame(frame)) {
        LOG_ERROR(TAG, "Frame read failed");
        return FrameStatus::SENSOR_FAILURE;
    }

    int dim = expectedDim(m_settings.resolution);
    if (frame.rows() != dim || frame.cols() != dim) {
        LOG_ERROR(TAG, "Frame is %dx%d, expected %dx%d",
                  frame.rows(), frame.cols(), dim, dim);
        return FrameStatus::SENSOR_FAILURE;
    }

    frame.flipVertical();
    frame.flipHorizontal();

    if (Logger::instance().isEnabled(LogLevel::DEBUG)) {
        LOG_DEBUG(TAG, "Distances\n%s", frame.toString().c_str());
    }

    out = frame;
    return FrameStatus::OK;
}

void SensorFrameSource::shutdown() {
    if (!m_ranging) return;

    m_sensor.stopRanging();
    m_ranging = false;
    LOG_INFO(TAG, "Ranging stopped");
}
