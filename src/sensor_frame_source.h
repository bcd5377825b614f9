/**
 * Trilobot v0.8 - ToF Frame Source
 *
 * Drives a RangingSensor: configure, start ranging, wait for each frame
 * and flip it vertically and horizontally so row 0 is the top of the
 * view and column 0 the robot's left.
 */

#ifndef SENSOR_FRAME_SOURCE_H
#define SENSOR_FRAME_SOURCE_H

#include <cstdint>

#include "frame_source.h"
#include "ranging_sensor.h"
#include "pacer.h"

class SensorFrameSource : public FrameSource {
public:
    SensorFrameSource(RangingSensor& sensor, Pacer& pacer,
                      const SensorSettings& settings, uint32_t ready_wait_ms);
    ~SensorFrameSource() override;

    bool init() override;
    FrameStatus nextFrame(DistanceFrame& out) override;
    void shutdown() override;

    bool isRanging() const { return m_ranging; }

private:
    static int expectedDim(int resolution);

    RangingSensor& m_sensor;
    Pacer& m_pacer;
    SensorSettings m_settings;
    uint32_t m_ready_wait_ms;
    bool m_ranging;
};

#endif // SENSOR_FRAME_SOURCE_H
