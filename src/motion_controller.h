/**
 * Trilobot v0.8 - Motion Controller
 *
 * Reactive avoidance loop:
 *
 *   FORWARD    --clear-->     FORWARD     drive on, re-poll
 *   FORWARD    --collision--> BACKING_UP
 *   BACKING_UP ------------>  TURNING     after a fixed number of reverse pulses
 *   TURNING    --collision--> TURNING     decide, turn, hold, re-poll
 *   TURNING    --clear-->     FORWARD
 *
 * Runs until the pacer reports cancellation or the frame source fails.
 * Either way the last motor command is a stop.
 */

#ifndef MOTION_CONTROLLER_H
#define MOTION_CONTROLLER_H

#include <cstdint>
#include <functional>
#include <random>

#include "actuator.h"
#include "collision_detector.h"
#include "error_handler.h"
#include "frame_source.h"
#include "pacer.h"
#include "turn_decision.h"
#include "zone_averager.h"

enum class RobotState {
    FORWARD,
    BACKING_UP,
    TURNING
};

enum class RunResult {
    RUNNING,
    CANCELLED,
    SENSOR_FAILURE
};

const char* robotStateToString(RobotState state);
const char* runResultToString(RunResult result);

class MotionController {
public:
    struct Profile {
        int collision_threshold = 200;
        int turn_tolerance = 1;
        ZoneLayout zones = defaultZoneLayout();

        bool drive_enabled = true;
        float forward_left = 0.50f;     // offsets already applied
        float forward_right = 0.50f;
        float turn_speed = 0.45f;
        float backup_speed = 0.45f;

        uint32_t forward_poll_ms = 250;
        uint32_t turn_hold_ms = 450;
        uint32_t backup_pulse_ms = 150;
        int backup_pulses = 5;
        uint32_t blink_ms = 250;

        uint32_t random_seed = 0;       // 0 = nondeterministic
    };

    // Returns a percentage in [0, 100)
    using RandomCallback = std::function<double()>;
    using TransitionCallback = std::function<void(RobotState from, RobotState to)>;

    MotionController(FrameSource& source, Actuator& actuator, Pacer& pacer,
                     ErrorHandler& errors, const Profile& profile,
                     const TurnDecisionEngine& engine = TurnDecisionEngine(),
                     const ZoneAverager& averager = ZoneAverager());
    ~MotionController();

    void setRandomCallback(RandomCallback cb) { m_random_cb = cb; }
    void setTransitionCallback(TransitionCallback cb) { m_transition_cb = cb; }

    /**
     * Run the loop until cancelled or a fatal sensor error.
     * Motors are stopped before returning.
     */
    RunResult run();

    /**
     * Execute one state action. Returns false once the loop must end;
     * getResult() then says why.
     */
    bool step();

    /**
     * Command zero speed and switch the underlights off. Ignores drive_enabled.
     */
    void stop();

    // State
    RobotState getState() const { return m_state; }
    TurnDirection getTurnBias() const { return m_turn_bias; }
    RunResult getResult() const { return m_result; }
    const Profile& getProfile() const { return m_profile; }

    // Latest reading
    bool hasReading() const { return m_reading_valid; }
    bool isCollision() const { return m_collision; }
    const ZoneAverages& getAverages() const { return m_averages; }

    // Counters
    uint32_t getPollCount() const { return m_polls; }
    uint32_t getSkippedCount() const { return m_skipped; }
    uint32_t getTurnCount() const { return m_turns; }

private:
    MotionController(const MotionController&) = delete;
    MotionController& operator=(const MotionController&) = delete;

    enum class PollResult {
        OK,
        SKIPPED,    // zone error, cycle dropped
        STOPPED     // cancelled or sensor failure, m_result set
    };

    bool stepForward();
    bool stepBackingUp();
    bool stepTurning();

    PollResult poll();
    bool skipCycle();
    bool hold(LightGroup group, uint32_t ms);
    bool cancelled();

    void drive(float left, float right);
    void transition(RobotState next);
    void raiseAlarm();

    double drawRandom();

    FrameSource& m_source;
    Actuator& m_actuator;
    Pacer& m_pacer;
    ErrorHandler& m_errors;
    Profile m_profile;
    TurnDecisionEngine m_engine;
    ZoneAverager m_averager;

    RobotState m_state = RobotState::FORWARD;
    TurnDirection m_turn_bias = TurnDirection::NONE;
    RunResult m_result = RunResult::RUNNING;

    bool m_reading_valid = false;
    bool m_collision = false;
    ZoneAverages m_averages;

    uint32_t m_polls = 0;
    uint32_t m_skipped = 0;
    uint32_t m_turns = 0;

    std::mt19937 m_rng;
    RandomCallback m_random_cb;
    TransitionCallback m_transition_cb;
};

#endif // MOTION_CONTROLLER_H
