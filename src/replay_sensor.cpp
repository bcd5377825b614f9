/**
 * Trilobot v0.8 - Replay Sensor Implementation
 *
 * Uses nlohmann/json for parsing.
 */

#include "replay_sensor.h"
#include "logger.h"

#include <cmath>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

extern "C" {
#include "tofbot_limits.h"
}

using json = nlohmann::json;

static const char* TAG = "Replay";

ReplaySensor::ReplaySensor()
    : m_index(0)
    , m_resolution(64)
    , m_ranging(false)
{
}

bool ReplaySensor::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_error = "cannot open " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!parseJson(buffer.str())) {
        return false;
    }

    LOG_INFO(TAG, "Loaded %zu frames from %s", m_frames.size(), path.c_str());
    return true;
}

bool ReplaySensor::parseJson(const std::string& json_content) {
    try {
        json root = json::parse(json_content);

        int resolution = root.value("resolution", 64);
        int dim = static_cast<int>(std::lround(std::sqrt(static_cast<double>(resolution))));
        if (dim <= 0 || dim * dim != resolution) {
            m_error = "resolution must be a square zone count";
            return false;
        }

        if (!root.contains("frames") || !root["frames"].is_array() || root["frames"].empty()) {
            m_error = "missing or empty \"frames\" array";
            return false;
        }

        std::vector<DistanceFrame> frames;
        for (auto& frame_data : root["frames"]) {
            if (!frame_data.is_array() || frame_data.size() != static_cast<size_t>(resolution)) {
                m_error = "frame " + std::to_string(frames.size()) + " does not hold " +
                          std::to_string(resolution) + " samples";
                return false;
            }

            std::vector<uint32_t> samples;
            samples.reserve(resolution);
            for (auto& v : frame_data) {
                if (!v.is_number()) {
                    m_error = "frame " + std::to_string(frames.size()) + " holds a non-numeric sample";
                    return false;
                }
                // Invalid (negative) targets read as 0, the rest clamp to the 16-bit range
                double mm = v.get<double>();
                if (mm < 0.0) mm = 0.0;
                if (mm > DISTANCE_MAX) mm = DISTANCE_MAX;
                samples.push_back(static_cast<uint32_t>(mm));
            }

            DistanceFrame frame;
            frame.assign(dim, dim, samples);
            frames.push_back(frame);
        }

        m_frames.swap(frames);
        m_resolution = resolution;
        m_index = 0;
        m_error.clear();
        return true;
    } catch (const json::exception& e) {
        m_error = e.what();
        return false;
    }
}

bool ReplaySensor::configure(const SensorSettings& settings) {
    if (settings.resolution != m_resolution) {
        LOG_ERROR(TAG, "Recording has %d zones, configured for %d",
                  m_resolution, settings.resolution);
        return false;
    }
    return true;
}

bool ReplaySensor::startRanging() {
    if (m_frames.empty()) {
        LOG_ERROR(TAG, "No frames loaded");
        return false;
    }
    m_ranging = true;
    return true;
}

void ReplaySensor::stopRanging() {
    m_ranging = false;
}

bool ReplaySensor::isFrameReady() {
    return m_ranging;
}

bool ReplaySensor::getFrame(DistanceFrame& out) {
    if (!m_ranging || m_frames.empty()) return false;

    out = m_frames[m_index];
    m_index = (m_index + 1) % m_frames.size();
    return true;
}
