#ifndef MOCK_ACTUATOR_HPP
#define MOCK_ACTUATOR_HPP

#include <cstdint>
#include <vector>

#include "../../src/actuator.h"

/**
 * MockActuator - Records motor and underlight commands in order
 */
class MockActuator : public Actuator {
public:
    enum class Kind {
        MOTORS,
        LIGHTS_ON,
        LIGHTS_OFF
    };

    struct Command {
        Kind kind;
        float left;
        float right;
        LightGroup group;
        Color color;
    };

    void setMotorSpeeds(float left, float right) override {
        m_commands.push_back({Kind::MOTORS, left, right, 0, {0, 0, 0}});
    }

    void setIndicator(LightGroup group, const Color& color) override {
        m_commands.push_back({Kind::LIGHTS_ON, 0.0f, 0.0f, group, color});
    }

    void clearIndicator(LightGroup group) override {
        m_commands.push_back({Kind::LIGHTS_OFF, 0.0f, 0.0f, group, {0, 0, 0}});
    }

    void reset() { m_commands.clear(); }

    const std::vector<Command>& getCommands() const { return m_commands; }

    std::vector<Command> getMotorCommands() const {
        std::vector<Command> out;
        for (const auto& c : m_commands) {
            if (c.kind == Kind::MOTORS) out.push_back(c);
        }
        return out;
    }

    bool hasMotorCommand() const { return !getMotorCommands().empty(); }

    Command lastMotorCommand() const {
        Command last = {Kind::MOTORS, -99.0f, -99.0f, 0, {0, 0, 0}};
        for (const auto& c : m_commands) {
            if (c.kind == Kind::MOTORS) last = c;
        }
        return last;
    }

    int countLightsOn(LightGroup group, const Color& color) const {
        int n = 0;
        for (const auto& c : m_commands) {
            if (c.kind == Kind::LIGHTS_ON && c.group == group && c.color == color) n++;
        }
        return n;
    }

    int countMotors(float left, float right) const {
        int n = 0;
        for (const auto& c : m_commands) {
            if (c.kind == Kind::MOTORS && c.left == left && c.right == right) n++;
        }
        return n;
    }

private:
    std::vector<Command> m_commands;
};

#endif // MOCK_ACTUATOR_HPP
