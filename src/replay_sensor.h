/**
 * Trilobot v0.8 - Replay Sensor
 *
 * RangingSensor that plays back raw frames recorded to JSON, so the
 * avoidance loop can run on a bench without the VL53L5CX.
 *
 * File format:
 *   { "resolution": 64, "frames": [ [64 raw distances], ... ] }
 */

#ifndef REPLAY_SENSOR_H
#define REPLAY_SENSOR_H

#include <cstddef>
#include <string>
#include <vector>

#include "ranging_sensor.h"

class ReplaySensor : public RangingSensor {
public:
    ReplaySensor();

    bool loadFromFile(const std::string& path);
    bool parseJson(const std::string& json_content);

    bool configure(const SensorSettings& settings) override;
    bool startRanging() override;
    void stopRanging() override;
    bool isFrameReady() override;
    bool getFrame(DistanceFrame& out) override;

    size_t frameCount() const { return m_frames.size(); }
    size_t currentIndex() const { return m_index; }
    const std::string& lastError() const { return m_error; }

private:
    std::vector<DistanceFrame> m_frames;
    size_t m_index;
    int m_resolution;
    bool m_ranging;
    std::string m_error;
};

#endif // REPLAY_SENSOR_H
