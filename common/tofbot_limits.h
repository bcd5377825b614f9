#ifndef TOFBOT_LIMITS_H
#define TOFBOT_LIMITS_H

#include <stdint.h>

// VL53L5CX frame geometry (8x8 mode)
#define FRAME_DIM_TOF         8
#define FRAME_CELLS_TOF       (FRAME_DIM_TOF * FRAME_DIM_TOF)

// Ultrasonic ranger delivers a single cell
#define FRAME_DIM_ULTRASONIC  1

// Motor command hard clamps (Actuator enforces these ALWAYS)
#define MOTOR_SPEED_MIN       -1.0f
#define MOTOR_SPEED_MAX       1.0f
#define MOTOR_SPEED_STOP      0.0f

// Distances are 16-bit on the wire (mm for ToF, cm for ultrasonic)
#define DISTANCE_MAX          65535

// Configuration sanity bounds
#define CONFIG_DURATION_MAX_MS  60000
#define CONFIG_COUNT_MAX        1000

// Sensor acquisition
#define SENSOR_RETRY_MAX      10
#define SENSOR_READY_POLL_MS  5
#define SENSOR_READY_WAIT_MS  1000

// Failure alarm (left+right underlights, red)
#define ALARM_BLINK_CYCLES    10

// Tie-break draw is a percentage in [0, 100)
#define TURN_RANDOM_SPAN      100.0
#define TURN_RANDOM_SPLIT     50.0

// Pacing sleeps are sliced so cancellation is seen within this period
#define PACER_SLICE_MS        10

// Inline clamp function
static inline float clamp_motor_speed(float value) {
    if (value < MOTOR_SPEED_MIN) return MOTOR_SPEED_MIN;
    if (value > MOTOR_SPEED_MAX) return MOTOR_SPEED_MAX;
    return value;
}

#endif // TOFBOT_LIMITS_H
