/**
 * Trilobot v0.8 - Distance Frame
 *
 * One grid snapshot of distance samples. 8x8 from the VL53L5CX,
 * 1x1 from the ultrasonic ranger.
 */

#ifndef DISTANCE_FRAME_H
#define DISTANCE_FRAME_H

#include <cstdint>
#include <string>
#include <vector>

class DistanceFrame {
public:
    DistanceFrame();
    DistanceFrame(int rows, int cols);

    /**
     * Build a frame from row-major samples.
     * Returns false if samples.size() != rows * cols.
     */
    bool assign(int rows, int cols, const std::vector<uint32_t>& samples);

    int rows() const { return m_rows; }
    int cols() const { return m_cols; }
    bool empty() const { return m_samples.empty(); }

    uint32_t at(int row, int col) const { return m_samples[row * m_cols + col]; }
    void set(int row, int col, uint32_t value) { m_samples[row * m_cols + col] = value; }

    const std::vector<uint32_t>& samples() const { return m_samples; }

    // Sensor mounting puts the raw image upside down and mirrored
    void flipVertical();
    void flipHorizontal();

    /**
     * Row/column dump for debug logs.
     */
    std::string toString() const;

private:
    int m_rows;
    int m_cols;
    std::vector<uint32_t> m_samples;
};

#endif // DISTANCE_FRAME_H
