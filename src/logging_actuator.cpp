/**
 * Trilobot v0.8 - Logging Actuator Implementation
 */

#include "logging_actuator.h"
#include "logger.h"

static const char* TAG = "Drive";

LoggingActuator::LoggingActuator()
    : m_left(0.0f)
    , m_right(0.0f)
    , m_lit(0)
    , m_commands(0)
{
}

std::string LoggingActuator::groupToString(LightGroup group) {
    static const struct {
        LightGroup bit;
        const char* name;
    } names[] = {
        {LIGHT_FRONT_LEFT,   "FL"},
        {LIGHT_MIDDLE_LEFT,  "ML"},
        {LIGHT_REAR_LEFT,    "RL"},
        {LIGHT_FRONT_RIGHT,  "FR"},
        {LIGHT_MIDDLE_RIGHT, "MR"},
        {LIGHT_REAR_RIGHT,   "RR"},
    };

    std::string out;
    for (const auto& n : names) {
        if (group & n.bit) {
            if (!out.empty()) out += ",";
            out += n.name;
        }
    }
    return out.empty() ? "none" : out;
}

void LoggingActuator::setMotorSpeeds(float left, float right) {
    m_left = left;
    m_right = right;
    m_commands++;
    LOG_INFO(TAG, "Motors L=%+.2f R=%+.2f", left, right);
}

void LoggingActuator::setIndicator(LightGroup group, const Color& color) {
    m_lit |= group;
    m_commands++;
    LOG_DEBUG(TAG, "Lights %s = (%u,%u,%u)", groupToString(group).c_str(),
              color.r, color.g, color.b);
}

void LoggingActuator::clearIndicator(LightGroup group) {
    m_lit &= ~group;
    m_commands++;
    LOG_DEBUG(TAG, "Lights %s off", groupToString(group).c_str());
}
