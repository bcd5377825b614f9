/**
 * Trilobot v0.8 - Collision Detector
 */

#ifndef COLLISION_DETECTOR_H
#define COLLISION_DETECTOR_H

class CollisionDetector {
public:
    /**
     * Imminent collision when the center zone is at or inside the threshold.
     * Both values must be in the deployment's configured unit.
     */
    static bool detect(int center_average, int threshold) {
        return center_average <= threshold;
    }
};

#endif // COLLISION_DETECTOR_H
