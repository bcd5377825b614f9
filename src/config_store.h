/**
 * Trilobot v0.8 - Configuration Store
 *
 * Startup constants for the avoidance loop, loaded from and saved to a
 * JSON file. Keys missing from the file keep their defaults.
 */

#ifndef CONFIG_STORE_H
#define CONFIG_STORE_H

#include <cstdint>
#include <string>

#include "motion_controller.h"
#include "ranging_sensor.h"
#include "turn_decision.h"
#include "ultrasonic_frame_source.h"
#include "zone_averager.h"

class ConfigStore {
public:
    ConfigStore();

    /**
     * Load configuration from file.
     */
    bool load(const std::string& path);

    /**
     * Save configuration to file.
     */
    bool save(const std::string& path) const;

    bool parseJson(const std::string& json_content);
    std::string toJson() const;

    /**
     * Check cross-field consistency (zones fit the frame, units match the
     * sensor, speeds in range). error names the first problem found.
     */
    bool validate(std::string& error) const;

    const std::string& lastError() const { return m_error; }

    TurnPolicy turnPolicy() const;
    AveragingMode averagingMode() const;
    bool isUltrasonic() const { return sensor == "ultrasonic"; }
    int frameDim() const;

    /**
     * Control loop settings with forward offsets folded into the speeds.
     */
    MotionController::Profile motionProfile() const;

    // Sensor and unit system ("tof" + "mm", or "ultrasonic" + "cm")
    std::string sensor = "tof";
    std::string units = "mm";

    // Decision
    int collision_threshold = 200;
    int turn_tolerance = 1;
    std::string turn_policy = "geometric";
    std::string averaging = "truncate";
    uint32_t random_seed = 0;   // 0 = seed from std::random_device

    ZoneLayout zones;

    // Drive
    bool drive_enabled = true;
    float forward_left_speed = 0.50f;
    float forward_right_speed = 0.50f;
    float forward_left_offset = 0.0f;
    float forward_right_offset = 0.0f;
    float turn_speed = 0.45f;
    float backup_speed = 0.45f;

    // Timing
    uint32_t forward_poll_ms = 250;
    uint32_t turn_hold_ms = 450;
    uint32_t backup_pulse_ms = 150;
    int backup_pulses = 5;
    uint32_t blink_ms = 250;

    // Sensors
    SensorSettings tof;
    uint32_t tof_ready_wait_ms = 1000;
    UltrasonicFrameSource::Profile ultrasonic;

private:
    mutable std::string m_error;
};

#endif // CONFIG_STORE_H
