/**
 * Trilobot v0.8 - Zone Averager
 *
 * Reduces zone samples to one integer distance per zone.
 */

#ifndef ZONE_AVERAGER_H
#define ZONE_AVERAGER_H

#include <cstdint>

#include "distance_frame.h"
#include "zone_extractor.h"

enum class AveragingMode {
    TRUNCATE,   // integer cast of the mean (default)
    ROUND       // round half up
};

struct ZoneAverages {
    int left = 0;
    int center = 0;
    int right = 0;
};

/**
 * Zone layout used for one deployment.
 */
struct ZoneLayout {
    ZoneSpec left;
    ZoneSpec center;
    ZoneSpec right;
};

ZoneLayout defaultZoneLayout();

class ZoneAverager {
public:
    explicit ZoneAverager(AveragingMode mode = AveragingMode::TRUNCATE);

    void setMode(AveragingMode mode) { m_mode = mode; }
    AveragingMode getMode() const { return m_mode; }

    /**
     * Arithmetic mean of samples.
     * @return EMPTY_INPUT if there are no samples, out untouched
     */
    ZoneStatus average(const SampleSet& samples, int& out) const;

    /**
     * Extract and average all three zones of a frame.
     * Stops at the first failing zone; out is only written on OK.
     */
    ZoneStatus averageZones(const DistanceFrame& frame, const ZoneLayout& layout,
                            ZoneAverages& out) const;

private:
    ZoneStatus averageZone(const DistanceFrame& frame, const ZoneSpec& zone, int& out) const;

    AveragingMode m_mode;
};

#endif // ZONE_AVERAGER_H
