/**
 * Trilobot v0.8 - Turn Decision Engine
 *
 * Picks the reactive turn after a collision. Geometry decides when the
 * left/right averages differ by at least the tolerance; otherwise a
 * caller-supplied random percentage breaks the tie.
 */

#ifndef TURN_DECISION_H
#define TURN_DECISION_H

enum class TurnDirection {
    NONE,
    LEFT,
    RIGHT
};

enum class TurnPolicy {
    GEOMETRIC,       // asymmetry, then coin flip
    LAST_TURN_BIAS   // coin flip may repeat the previous turn before geometry is checked
};

const char* turnDirectionToString(TurnDirection dir);

class TurnDecisionEngine {
public:
    explicit TurnDecisionEngine(TurnPolicy policy = TurnPolicy::GEOMETRIC);

    void setPolicy(TurnPolicy policy) { m_policy = policy; }
    TurnPolicy getPolicy() const { return m_policy; }

    /**
     * @param random_value percentage in [0, 100)
     * @param last_turn    previous turn, only consulted by LAST_TURN_BIAS
     * @return LEFT or RIGHT, never NONE
     */
    TurnDirection decide(int left_average, int right_average, int tolerance,
                         double random_value,
                         TurnDirection last_turn = TurnDirection::NONE) const;

    static TurnDirection decideGeometric(int left_average, int right_average,
                                         int tolerance, double random_value);

    static TurnDirection decideWithBias(int left_average, int right_average,
                                        int tolerance, double random_value,
                                        TurnDirection last_turn);

private:
    TurnPolicy m_policy;
};

#endif // TURN_DECISION_H
