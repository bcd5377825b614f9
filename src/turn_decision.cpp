/**
 * Trilobot v0.8 - Turn Decision Engine Implementation
 */

#include "turn_decision.h"

#include <cstdint>

extern "C" {
#include "tofbot_limits.h"
}

const char* turnDirectionToString(TurnDirection dir) {
    switch (dir) {
        case TurnDirection::NONE:  return "none";
        case TurnDirection::LEFT:  return "left";
        case TurnDirection::RIGHT: return "right";
    }
    return "?";
}

// True when a is at least tolerance further than b. Widened so large
// averages or tolerances cannot overflow.
static bool moreRoom(int a, int b, int tolerance) {
    return static_cast<int64_t>(a) - static_cast<int64_t>(b) >= static_cast<int64_t>(tolerance);
}

TurnDecisionEngine::TurnDecisionEngine(TurnPolicy policy)
    : m_policy(policy)
{
}

TurnDirection TurnDecisionEngine::decide(int left_average, int right_average, int tolerance,
                                         double random_value, TurnDirection last_turn) const {
    if (m_policy == TurnPolicy::LAST_TURN_BIAS) {
        return decideWithBias(left_average, right_average, tolerance, random_value, last_turn);
    }
    return decideGeometric(left_average, right_average, tolerance, random_value);
}

TurnDirection TurnDecisionEngine::decideGeometric(int left_average, int right_average,
                                                  int tolerance, double random_value) {
    // Rule order matters: right-side room is checked first
    if (moreRoom(right_average, left_average, tolerance)) {
        return TurnDirection::RIGHT;
    }
    if (moreRoom(left_average, right_average, tolerance)) {
        return TurnDirection::LEFT;
    }
    if (random_value < TURN_RANDOM_SPLIT) {
        return TurnDirection::RIGHT;
    }
    return TurnDirection::LEFT;
}

TurnDirection TurnDecisionEngine::decideWithBias(int left_average, int right_average,
                                                 int tolerance, double random_value,
                                                 TurnDirection last_turn) {
    if ((random_value < TURN_RANDOM_SPLIT && last_turn == TurnDirection::RIGHT) ||
        moreRoom(right_average, left_average, tolerance)) {
        return TurnDirection::RIGHT;
    }
    if ((random_value > TURN_RANDOM_SPLIT && last_turn == TurnDirection::LEFT) ||
        moreRoom(left_average, right_average, tolerance)) {
        return TurnDirection::LEFT;
    }
    if (random_value < TURN_RANDOM_SPLIT) {
        return TurnDirection::RIGHT;
    }
    return TurnDirection::LEFT;
}
