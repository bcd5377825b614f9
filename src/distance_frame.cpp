/**
 * Trilobot v0.8 - Distance Frame Implementation
 */

#include "distance_frame.h"

#include <algorithm>
#include <cstdio>

DistanceFrame::DistanceFrame()
    : m_rows(0)
    , m_cols(0)
{
}

DistanceFrame::DistanceFrame(int rows, int cols)
    : m_rows(rows > 0 ? rows : 0)
    , m_cols(cols > 0 ? cols : 0)
    , m_samples(static_cast<size_t>(m_rows) * m_cols, 0)
{
}

bool DistanceFrame::assign(int rows, int cols, const std::vector<uint32_t>& samples) {
    if (rows <= 0 || cols <= 0) return false;
    if (samples.size() != static_cast<size_t>(rows) * cols) return false;

    m_rows = rows;
    m_cols = cols;
    m_samples = samples;
    return true;
}

void DistanceFrame::flipVertical() {
    for (int top = 0, bottom = m_rows - 1; top < bottom; top++, bottom--) {
        std::swap_ranges(m_samples.begin() + top * m_cols,
                         m_samples.begin() + (top + 1) * m_cols,
                         m_samples.begin() + bottom * m_cols);
    }
}

void DistanceFrame::flipHorizontal() {
    for (int r = 0; r < m_rows; r++) {
        auto row_begin = m_samples.begin() + r * m_cols;
        std::reverse(row_begin, row_begin + m_cols);
    }
}

std::string DistanceFrame::toString() const {
    std::string out = "[\n";
    char cell[16];

    for (int r = 0; r < m_rows; r++) {
        out += "  [ ";
        for (int c = 0; c < m_cols; c++) {
            snprintf(cell, sizeof(cell), "%6u", at(r, c));
            out += cell;
            out += (c == m_cols - 1) ? " ]\n" : ", ";
        }
    }

    out += "]";
    return out;
}
