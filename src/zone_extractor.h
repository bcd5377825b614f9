/**
 * Trilobot v0.8 - Zone Extractor
 *
 * Cuts rectangular zones out of a DistanceFrame. The three standard
 * zones split the 8x8 ToF field of view into left/center/right.
 */

#ifndef ZONE_EXTRACTOR_H
#define ZONE_EXTRACTOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "distance_frame.h"

enum class ZoneStatus {
    OK,
    OUT_OF_BOUNDS,
    EMPTY_INPUT
};

const char* zoneStatusToString(ZoneStatus status);

/**
 * Inclusive row/column bounds of a zone.
 */
struct ZoneSpec {
    std::string name;
    int start_row;
    int start_col;
    int end_row;
    int end_col;
};

// Standard 8x8 zones
extern const ZoneSpec ZONE_CENTER;
extern const ZoneSpec ZONE_LEFT;
extern const ZoneSpec ZONE_RIGHT;

/**
 * Rectangular block of samples in frame row/column order.
 */
struct SampleSet {
    int rows = 0;
    int cols = 0;
    std::vector<uint32_t> values;

    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    uint32_t at(int row, int col) const { return values[row * cols + col]; }
};

class ZoneExtractor {
public:
    /**
     * Copy the cells enclosed by zone into out.
     *
     * Requires 0 <= start <= end <= dim-1 on both axes. On failure out is
     * left empty, never holding a partial result.
     */
    static ZoneStatus extract(const DistanceFrame& frame, const ZoneSpec& zone, SampleSet& out);

    /**
     * Check zone bounds against a rows x cols frame without extracting.
     */
    static bool fits(const ZoneSpec& zone, int rows, int cols);
};

#endif // ZONE_EXTRACTOR_H
