/**
 * Trilobot v0.8 - Actuator Interface
 *
 * Abstract interface for the drive motors and the six underlights.
 * Implementations: LoggingActuator (dry run), board driver, test mock.
 */

#ifndef ACTUATOR_H
#define ACTUATOR_H

#include <cstdint>

// Underlight bits, combined into a LightGroup
enum : uint8_t {
    LIGHT_FRONT_LEFT   = 1 << 0,
    LIGHT_MIDDLE_LEFT  = 1 << 1,
    LIGHT_REAR_LEFT    = 1 << 2,
    LIGHT_FRONT_RIGHT  = 1 << 3,
    LIGHT_MIDDLE_RIGHT = 1 << 4,
    LIGHT_REAR_RIGHT   = 1 << 5
};

typedef uint8_t LightGroup;

static const LightGroup LIGHTS_LEFT  = LIGHT_FRONT_LEFT | LIGHT_MIDDLE_LEFT;
static const LightGroup LIGHTS_RIGHT = LIGHT_FRONT_RIGHT | LIGHT_MIDDLE_RIGHT;
static const LightGroup LIGHTS_REAR  = LIGHT_REAR_LEFT | LIGHT_REAR_RIGHT;
static const LightGroup LIGHTS_FRONT = LIGHT_FRONT_LEFT | LIGHT_FRONT_RIGHT;
static const LightGroup LIGHTS_ALL   = 0x3F;

struct Color {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

static const Color COLOR_RED    = {255, 0, 0};
static const Color COLOR_GREEN  = {0, 255, 0};
static const Color COLOR_BLUE   = {0, 0, 255};
static const Color COLOR_YELLOW = {255, 255, 0};
static const Color COLOR_PURPLE = {127, 0, 127};
static const Color COLOR_CYAN   = {0, 255, 255};

// Cue per robot state; each turn direction has its own color
static const Color COLOR_FORWARD     = {0, 255, 0};      // green
static const Color COLOR_BACKING_UP  = {255, 255, 0};    // yellow
static const Color COLOR_TURN_LEFT   = {0, 0, 255};      // blue
static const Color COLOR_TURN_RIGHT  = {0, 255, 255};    // cyan
static const Color COLOR_ALARM       = {255, 0, 0};      // red

class Actuator {
public:
    virtual ~Actuator() = default;

    /**
     * Set wheel speeds, each in [-1.0, 1.0]. Negative is reverse.
     */
    virtual void setMotorSpeeds(float left, float right) = 0;

    /**
     * Light every underlight in group with color.
     */
    virtual void setIndicator(LightGroup group, const Color& color) = 0;

    /**
     * Switch off every underlight in group.
     */
    virtual void clearIndicator(LightGroup group) = 0;
};

#endif // ACTUATOR_H
