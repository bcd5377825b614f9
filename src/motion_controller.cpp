/**
 * Trilobot v0.8 - Motion Controller Implementation
 */

#include "motion_controller.h"
#include "logger.h"

extern "C" {
#include "tofbot_limits.h"
}

static const char* TAG = "Motion";

const char* robotStateToString(RobotState state) {
    switch (state) {
        case RobotState::FORWARD:    return "FORWARD";
        case RobotState::BACKING_UP: return "BACKING_UP";
        case RobotState::TURNING:    return "TURNING";
    }
    return "UNKNOWN";
}

const char* runResultToString(RunResult result) {
    switch (result) {
        case RunResult::RUNNING:        return "RUNNING";
        case RunResult::CANCELLED:      return "CANCELLED";
        case RunResult::SENSOR_FAILURE: return "SENSOR_FAILURE";
    }
    return "UNKNOWN";
}

MotionController::MotionController(FrameSource& source, Actuator& actuator, Pacer& pacer,
                                   ErrorHandler& errors, const Profile& profile,
                                   const TurnDecisionEngine& engine,
                                   const ZoneAverager& averager)
    : m_source(source)
    , m_actuator(actuator)
    , m_pacer(pacer)
    , m_errors(errors)
    , m_profile(profile)
    , m_engine(engine)
    , m_averager(averager)
{
    if (m_profile.random_seed != 0) {
        m_rng.seed(m_profile.random_seed);
    } else {
        std::random_device rd;
        m_rng.seed(rd());
    }

    // A CRITICAL report means the robot can no longer sense: stop and flash
    m_errors.setCriticalCallback([this](const std::string&) { raiseAlarm(); });
}

MotionController::~MotionController() {
    // The handler outlives us; later CRITICAL reports must not reach a dead controller
    m_errors.setCriticalCallback(nullptr);
}

RunResult MotionController::run() {
    LOG_INFO(TAG, "Starting: threshold=%d, tolerance=%d, drive %s",
             m_profile.collision_threshold, m_profile.turn_tolerance,
             m_profile.drive_enabled ? "ON" : "OFF");

    while (step()) {
    }

    stop();

    LOG_INFO(TAG, "Stopped (%s) after %u polls, %u turns, %u skipped cycles",
             runResultToString(m_result), m_polls, m_turns, m_skipped);
    return m_result;
}

bool MotionController::step() {
    if (m_result != RunResult::RUNNING) return false;
    if (cancelled()) return false;

    switch (m_state) {
        case RobotState::FORWARD:
            return stepForward();
        case RobotState::BACKING_UP:
            return stepBackingUp();
        case RobotState::TURNING:
            return stepTurning();
    }
    return false;
}

void MotionController::stop() {
    m_actuator.setMotorSpeeds(MOTOR_SPEED_STOP, MOTOR_SPEED_STOP);
    m_actuator.clearIndicator(LIGHTS_ALL);
}

bool MotionController::stepForward() {
    PollResult r = poll();
    if (r == PollResult::STOPPED) return false;
    if (r == PollResult::SKIPPED) return skipCycle();

    if (m_collision) {
        LOG_INFO(TAG, "Collision ahead: center %d <= %d",
                 m_averages.center, m_profile.collision_threshold);
        transition(RobotState::BACKING_UP);
        return true;
    }

    LOG_DEBUG(TAG, "Moving forward: left %d, center %d, right %d",
              m_averages.left, m_averages.center, m_averages.right);

    m_actuator.setIndicator(LIGHTS_FRONT, COLOR_FORWARD);
    drive(m_profile.forward_left, m_profile.forward_right);
    return hold(LIGHTS_FRONT, m_profile.forward_poll_ms);
}

bool MotionController::stepBackingUp() {
    LOG_INFO(TAG, "Backing up: %d pulses of %u ms",
             m_profile.backup_pulses, m_profile.backup_pulse_ms);

    for (int pulse = 0; pulse < m_profile.backup_pulses; pulse++) {
        m_actuator.setIndicator(LIGHTS_REAR, COLOR_BACKING_UP);
        drive(-m_profile.backup_speed, -m_profile.backup_speed);
        if (!hold(LIGHTS_REAR, m_profile.backup_pulse_ms)) {
            return false;
        }
    }

    // No re-check here: the reading that triggered the backup drives the first turn
    transition(RobotState::TURNING);
    return true;
}

bool MotionController::stepTurning() {
    if (!m_reading_valid) {
        PollResult r = poll();
        if (r == PollResult::STOPPED) return false;
        if (r == PollResult::SKIPPED) return skipCycle();
    }

    if (!m_collision) {
        transition(RobotState::FORWARD);
        return true;
    }

    double percent = drawRandom();
    TurnDirection dir = m_engine.decide(m_averages.left, m_averages.right,
                                        m_profile.turn_tolerance, percent, m_turn_bias);

    LOG_INFO(TAG, "Turning %s: percent %.2f, left %d, right %d, last %s",
             turnDirectionToString(dir), percent, m_averages.left, m_averages.right,
             turnDirectionToString(m_turn_bias));

    m_turn_bias = dir;
    m_turns++;

    LightGroup side = (dir == TurnDirection::LEFT) ? LIGHTS_LEFT : LIGHTS_RIGHT;
    m_actuator.setIndicator(side, (dir == TurnDirection::LEFT) ? COLOR_TURN_LEFT : COLOR_TURN_RIGHT);
    if (dir == TurnDirection::LEFT) {
        drive(-m_profile.turn_speed, m_profile.turn_speed);
    } else {
        drive(m_profile.turn_speed, -m_profile.turn_speed);
    }
    if (!hold(side, m_profile.turn_hold_ms)) {
        return false;
    }

    PollResult r = poll();
    if (r == PollResult::STOPPED) return false;
    if (r == PollResult::SKIPPED) return skipCycle();

    LOG_DEBUG(TAG, "Turning distance %d, collision %s",
              m_averages.center, m_collision ? "true" : "false");

    if (!m_collision) {
        transition(RobotState::FORWARD);
    }
    return true;
}

MotionController::PollResult MotionController::poll() {
    if (cancelled()) return PollResult::STOPPED;

    m_reading_valid = false;

    DistanceFrame frame;
    FrameStatus fs = m_source.nextFrame(frame);

    if (fs == FrameStatus::CANCELLED) {
        m_result = RunResult::CANCELLED;
        return PollResult::STOPPED;
    }
    if (fs == FrameStatus::SENSOR_FAILURE) {
        m_result = RunResult::SENSOR_FAILURE;
        m_errors.report(ErrorLevel::CRITICAL, TAG, "Unable to get a valid distance reading");
        return PollResult::STOPPED;
    }

    m_polls++;

    ZoneAverages averages;
    ZoneStatus zs = m_averager.averageZones(frame, m_profile.zones, averages);
    if (zs != ZoneStatus::OK) {
        m_skipped++;
        m_errors.report(ErrorLevel::ERROR, TAG,
                        std::string("Zone averaging failed (") + zoneStatusToString(zs) +
                        "), skipping cycle");
        return PollResult::SKIPPED;
    }

    m_averages = averages;
    m_collision = CollisionDetector::detect(m_averages.center, m_profile.collision_threshold);
    m_reading_valid = true;
    return PollResult::OK;
}

bool MotionController::skipCycle() {
    stop();
    if (!m_pacer.sleepMs(m_profile.forward_poll_ms)) {
        m_result = RunResult::CANCELLED;
        return false;
    }
    return true;
}

bool MotionController::hold(LightGroup group, uint32_t ms) {
    bool completed = m_pacer.sleepMs(ms);
    m_actuator.clearIndicator(group);
    if (!completed) {
        m_result = RunResult::CANCELLED;
        return false;
    }
    return true;
}

bool MotionController::cancelled() {
    if (!m_pacer.cancelled()) return false;
    if (m_result == RunResult::RUNNING) {
        m_result = RunResult::CANCELLED;
        LOG_INFO(TAG, "Cancelled in state %s", robotStateToString(m_state));
    }
    return true;
}

void MotionController::drive(float left, float right) {
    if (!m_profile.drive_enabled) {
        LOG_DEBUG(TAG, "Drive off, suppressed L=%+.2f R=%+.2f", left, right);
        return;
    }
    m_actuator.setMotorSpeeds(clamp_motor_speed(left), clamp_motor_speed(right));
}

void MotionController::transition(RobotState next) {
    RobotState prev = m_state;
    m_state = next;

    LOG_DEBUG(TAG, "%s -> %s", robotStateToString(prev), robotStateToString(next));

    if (m_transition_cb) {
        m_transition_cb(prev, next);
    }
}

void MotionController::raiseAlarm() {
    stop();

    const LightGroup sides = LIGHTS_LEFT | LIGHTS_RIGHT;
    for (int cycle = 0; cycle < ALARM_BLINK_CYCLES; cycle++) {
        m_actuator.setIndicator(sides, COLOR_ALARM);
        bool completed = m_pacer.sleepMs(m_profile.blink_ms);
        m_actuator.clearIndicator(sides);
        if (!completed) break;
    }
}

double MotionController::drawRandom() {
    if (m_random_cb) {
        return m_random_cb();
    }
    std::uniform_real_distribution<double> dist(0.0, TURN_RANDOM_SPAN);
    return dist(m_rng);
}
