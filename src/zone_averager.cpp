/**
 * Trilobot v0.8 - Zone Averager Implementation
 */

#include "zone_averager.h"
#include "logger.h"

#include <limits>

static const char* TAG = "Zone";

ZoneLayout defaultZoneLayout() {
    return ZoneLayout{ZONE_LEFT, ZONE_CENTER, ZONE_RIGHT};
}

ZoneAverager::ZoneAverager(AveragingMode mode)
    : m_mode(mode)
{
}

ZoneStatus ZoneAverager::average(const SampleSet& samples, int& out) const {
    if (samples.empty()) {
        return ZoneStatus::EMPTY_INPUT;
    }

    uint64_t sum = 0;
    for (uint32_t v : samples.values) {
        sum += v;
    }

    uint64_t count = samples.size();
    uint64_t mean;
    if (m_mode == AveragingMode::ROUND) {
        mean = (sum + count / 2) / count;
    } else {
        // Non-negative samples, so integer division truncates toward zero
        mean = sum / count;
    }

    const uint64_t int_max = static_cast<uint64_t>(std::numeric_limits<int>::max());
    out = static_cast<int>(mean > int_max ? int_max : mean);
    return ZoneStatus::OK;
}

ZoneStatus ZoneAverager::averageZone(const DistanceFrame& frame, const ZoneSpec& zone, int& out) const {
    SampleSet samples;
    ZoneStatus status = ZoneExtractor::extract(frame, zone, samples);
    if (status != ZoneStatus::OK) {
        return status;
    }

    if (Logger::instance().isEnabled(LogLevel::DEBUG)) {
        DistanceFrame view;
        if (view.assign(samples.rows, samples.cols, samples.values)) {
            LOG_DEBUG(TAG, "%s zone data\n%s", zone.name.c_str(), view.toString().c_str());
        }
    }

    return average(samples, out);
}

ZoneStatus ZoneAverager::averageZones(const DistanceFrame& frame, const ZoneLayout& layout,
                                      ZoneAverages& out) const {
    ZoneAverages result;
    ZoneStatus status;

    status = averageZone(frame, layout.center, result.center);
    if (status != ZoneStatus::OK) return status;

    status = averageZone(frame, layout.left, result.left);
    if (status != ZoneStatus::OK) return status;

    status = averageZone(frame, layout.right, result.right);
    if (status != ZoneStatus::OK) return status;

    LOG_DEBUG(TAG, "Left = %d, Center = %d, Right = %d",
              result.left, result.center, result.right);

    out = result;
    return ZoneStatus::OK;
}
