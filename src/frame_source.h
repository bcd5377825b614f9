/**
 * Trilobot v0.8 - Frame Source Interface
 *
 * Delivers one reoriented DistanceFrame per poll.
 * Implementations: SensorFrameSource (VL53L5CX), UltrasonicFrameSource.
 */

#ifndef FRAME_SOURCE_H
#define FRAME_SOURCE_H

#include "distance_frame.h"

enum class FrameStatus {
    OK,
    SENSOR_FAILURE,
    CANCELLED
};

const char* frameStatusToString(FrameStatus status);

class FrameSource {
public:
    virtual ~FrameSource() = default;

    /**
     * Bring up the sensor. Called once before the first poll.
     */
    virtual bool init() = 0;

    /**
     * Block until the next frame is available and copy it into out.
     * out is only written on OK.
     */
    virtual FrameStatus nextFrame(DistanceFrame& out) = 0;

    /**
     * Stop acquisition. Safe to call more than once.
     */
    virtual void shutdown() = 0;
};

#endif // FRAME_SOURCE_H
