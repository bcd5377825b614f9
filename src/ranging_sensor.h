/**
 * Trilobot v0.8 - Ranging Sensor Interface
 *
 * Contract of the multi-zone ToF driver (VL53L5CX). Frames come back
 * raw, before the mounting flip.
 */

#ifndef RANGING_SENSOR_H
#define RANGING_SENSOR_H

#include <cstdint>

#include "distance_frame.h"

struct SensorSettings {
    int resolution = 64;            // 16 (4x4) or 64 (8x8) zones
    int ranging_frequency_hz = 15;
    int integration_time_ms = 20;
    int sharpener_percent = 40;
};

class RangingSensor {
public:
    virtual ~RangingSensor() = default;

    /**
     * One-time setup, before startRanging().
     */
    virtual bool configure(const SensorSettings& settings) = 0;

    virtual bool startRanging() = 0;
    virtual void stopRanging() = 0;

    virtual bool isFrameReady() = 0;

    /**
     * Read the latest raw frame.
     */
    virtual bool getFrame(DistanceFrame& out) = 0;
};

#endif // RANGING_SENSOR_H
