/**
 * Trilobot v0.8 - Zone Extractor Implementation
 */

#include "zone_extractor.h"
#include "logger.h"

static const char* TAG = "Zone";

const ZoneSpec ZONE_CENTER = {"center", 2, 2, 5, 5};
const ZoneSpec ZONE_LEFT   = {"left",   0, 0, 7, 1};
const ZoneSpec ZONE_RIGHT  = {"right",  0, 6, 7, 7};

const char* zoneStatusToString(ZoneStatus status) {
    switch (status) {
        case ZoneStatus::OK:            return "OK";
        case ZoneStatus::OUT_OF_BOUNDS: return "OUT_OF_BOUNDS";
        case ZoneStatus::EMPTY_INPUT:   return "EMPTY_INPUT";
    }
    return "UNKNOWN";
}

bool ZoneExtractor::fits(const ZoneSpec& zone, int rows, int cols) {
    return zone.start_row >= 0 && zone.start_col >= 0 &&
           zone.start_row <= zone.end_row && zone.start_col <= zone.end_col &&
           zone.end_row < rows && zone.end_col < cols;
}

ZoneStatus ZoneExtractor::extract(const DistanceFrame& frame, const ZoneSpec& zone, SampleSet& out) {
    out.rows = 0;
    out.cols = 0;
    out.values.clear();

    if (!fits(zone, frame.rows(), frame.cols())) {
        LOG_DEBUG(TAG, "Zone '%s' rows %d-%d cols %d-%d outside %dx%d frame",
                  zone.name.c_str(), zone.start_row, zone.end_row,
                  zone.start_col, zone.end_col, frame.rows(), frame.cols());
        return ZoneStatus::OUT_OF_BOUNDS;
    }

    out.rows = zone.end_row - zone.start_row + 1;
    out.cols = zone.end_col - zone.start_col + 1;
    out.values.reserve(static_cast<size_t>(out.rows) * out.cols);

    for (int r = zone.start_row; r <= zone.end_row; r++) {
        for (int c = zone.start_col; c <= zone.end_col; c++) {
            out.values.push_back(frame.at(r, c));
        }
    }

    return ZoneStatus::OK;
}
