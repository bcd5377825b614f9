/**
 * Trilobot v0.8 - Logging Actuator
 *
 * Stands in for the motor/underlight board: every command is logged
 * and the last state is kept for status output.
 */

#ifndef LOGGING_ACTUATOR_H
#define LOGGING_ACTUATOR_H

#include <cstdint>
#include <string>

#include "actuator.h"

class LoggingActuator : public Actuator {
public:
    LoggingActuator();

    void setMotorSpeeds(float left, float right) override;
    void setIndicator(LightGroup group, const Color& color) override;
    void clearIndicator(LightGroup group) override;

    float getLeftSpeed() const { return m_left; }
    float getRightSpeed() const { return m_right; }
    LightGroup getLitGroup() const { return m_lit; }
    uint32_t getCommandCount() const { return m_commands; }

    static std::string groupToString(LightGroup group);

private:
    float m_left;
    float m_right;
    LightGroup m_lit;
    uint32_t m_commands;
};

#endif // LOGGING_ACTUATOR_H
