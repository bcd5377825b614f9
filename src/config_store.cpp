/**
 * Trilobot v0.8 - Configuration Store Implementation
 *
 * Uses nlohmann/json for parsing and writing.
 */

#include "config_store.h"
#include "logger.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

extern "C" {
#include "tofbot_limits.h"
}

using json = nlohmann::json;

static const char* TAG = "Config";

static bool isSection(const json& node, const char* name, std::string& error) {
    if (!node.is_object()) {
        error = std::string(name) + " must be an object";
        return false;
    }
    return true;
}

/**
 * Read an optional integer key, rejecting non-integers and values outside
 * [lo, hi] instead of letting them wrap into the field's type.
 */
template <typename T>
static bool readInt(const json& node, const char* key, int64_t lo, int64_t hi,
                    T& field, std::string& error) {
    if (!node.contains(key)) return true;

    const json& v = node[key];
    if (!v.is_number_integer()) {
        error = std::string(key) + " must be an integer";
        return false;
    }

    bool in_range;
    int64_t value = 0;
    if (v.is_number_unsigned()) {
        uint64_t u = v.get<uint64_t>();
        in_range = u <= static_cast<uint64_t>(hi);
        value = static_cast<int64_t>(in_range ? u : 0);
        in_range = in_range && value >= lo;
    } else {
        value = v.get<int64_t>();
        in_range = value >= lo && value <= hi;
    }

    if (!in_range) {
        error = std::string(key) + " must be in [" + std::to_string(lo) + ", " +
                std::to_string(hi) + "]";
        return false;
    }

    field = static_cast<T>(value);
    return true;
}

static bool parseZone(const json& node, const char* key, ZoneSpec& zone, std::string& error) {
    if (!node.contains(key)) return true;

    const json& bounds = node[key];
    if (!bounds.is_array() || bounds.size() != 4) {
        error = std::string("zones.") + key + " must be [start_row, start_col, end_row, end_col]";
        return false;
    }

    // Clamped only to stay representable; validate() rejects anything off the grid
    int64_t coords[4];
    for (size_t i = 0; i < 4; i++) {
        if (!bounds[i].is_number_integer()) {
            error = std::string("zones.") + key + " bounds must be integers";
            return false;
        }
        if (bounds[i].is_number_unsigned()) {
            coords[i] = static_cast<int64_t>(
                std::min<uint64_t>(bounds[i].get<uint64_t>(), CONFIG_COUNT_MAX));
        } else {
            coords[i] = std::min<int64_t>(std::max<int64_t>(bounds[i].get<int64_t>(), -1),
                                          CONFIG_COUNT_MAX);
        }
    }

    zone.name = key;
    zone.start_row = static_cast<int>(coords[0]);
    zone.start_col = static_cast<int>(coords[1]);
    zone.end_row = static_cast<int>(coords[2]);
    zone.end_col = static_cast<int>(coords[3]);
    return true;
}

static json zoneToJson(const ZoneSpec& zone) {
    return json::array({zone.start_row, zone.start_col, zone.end_row, zone.end_col});
}

static bool speedInRange(float speed) {
    return speed >= MOTOR_SPEED_MIN && speed <= MOTOR_SPEED_MAX;
}

ConfigStore::ConfigStore()
    : zones(defaultZoneLayout())
{
}

bool ConfigStore::load(const std::string& path) {
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

    LOG_INFO(TAG, "Loaded from %s", path.c_str());
    return true;
}

bool ConfigStore::parseJson(const std::string& json_content) {
    // Parse into a copy so a bad file leaves the current values untouched
    ConfigStore next(*this);
    std::string error;

    try {
        json root = json::parse(json_content);
        if (!root.is_object()) {
            m_error = "top level must be an object";
            return false;
        }

        next.sensor = root.value("sensor", next.sensor);
        next.units = root.value("units", next.units);
        next.turn_policy = root.value("turn_policy", next.turn_policy);
        next.averaging = root.value("averaging", next.averaging);

        bool ok = readInt(root, "collision_threshold", 0, DISTANCE_MAX, next.collision_threshold, error) &&
                  readInt(root, "turn_tolerance", 0, DISTANCE_MAX, next.turn_tolerance, error) &&
                  readInt(root, "random_seed", 0, UINT32_MAX, next.random_seed, error);

        if (ok && root.contains("zones")) {
            const json& z = root["zones"];
            ok = isSection(z, "zones", error) &&
                 parseZone(z, "left", next.zones.left, error) &&
                 parseZone(z, "center", next.zones.center, error) &&
                 parseZone(z, "right", next.zones.right, error);
        }

        if (ok && root.contains("drive")) {
            const json& d = root["drive"];
            ok = isSection(d, "drive", error);
            if (ok) {
                next.drive_enabled = d.value("enabled", next.drive_enabled);
                next.forward_left_speed = d.value("forward_left", next.forward_left_speed);
                next.forward_right_speed = d.value("forward_right", next.forward_right_speed);
                next.forward_left_offset = d.value("forward_left_offset", next.forward_left_offset);
                next.forward_right_offset = d.value("forward_right_offset", next.forward_right_offset);
                next.turn_speed = d.value("turn_speed", next.turn_speed);
                next.backup_speed = d.value("backup_speed", next.backup_speed);
            }
        }

        if (ok && root.contains("timing")) {
            const json& t = root["timing"];
            ok = isSection(t, "timing", error) &&
                 readInt(t, "forward_poll_ms", 0, CONFIG_DURATION_MAX_MS, next.forward_poll_ms, error) &&
                 readInt(t, "turn_hold_ms", 0, CONFIG_DURATION_MAX_MS, next.turn_hold_ms, error) &&
                 readInt(t, "backup_pulse_ms", 0, CONFIG_DURATION_MAX_MS, next.backup_pulse_ms, error) &&
                 readInt(t, "backup_pulses", 0, CONFIG_COUNT_MAX, next.backup_pulses, error) &&
                 readInt(t, "blink_ms", 0, CONFIG_DURATION_MAX_MS, next.blink_ms, error);
        }

        if (ok && root.contains("tof")) {
            const json& s = root["tof"];
            ok = isSection(s, "tof", error) &&
                 readInt(s, "resolution", 0, CONFIG_COUNT_MAX, next.tof.resolution, error) &&
                 readInt(s, "ranging_frequency_hz", 1, 60, next.tof.ranging_frequency_hz, error) &&
                 readInt(s, "integration_time_ms", 2, 1000, next.tof.integration_time_ms, error) &&
                 readInt(s, "sharpener_percent", 0, 99, next.tof.sharpener_percent, error) &&
                 readInt(s, "ready_wait_ms", 0, CONFIG_DURATION_MAX_MS, next.tof_ready_wait_ms, error);
        }

        if (ok && root.contains("ultrasonic")) {
            const json& u = root["ultrasonic"];
            ok = isSection(u, "ultrasonic", error) &&
                 readInt(u, "readings", 1, CONFIG_COUNT_MAX, next.ultrasonic.readings, error) &&
                 readInt(u, "samples", 1, CONFIG_COUNT_MAX, next.ultrasonic.samples, error) &&
                 readInt(u, "timeout_ms", 0, CONFIG_DURATION_MAX_MS, next.ultrasonic.timeout_ms, error) &&
                 readInt(u, "reading_gap_ms", 0, CONFIG_DURATION_MAX_MS, next.ultrasonic.reading_gap_ms, error) &&
                 readInt(u, "retry_max", 1, CONFIG_COUNT_MAX, next.ultrasonic.retry_max, error);
        }

        if (!ok) {
            m_error = error;
            return false;
        }
    } catch (const json::exception& e) {
        m_error = e.what();
        return false;
    }

    if (!next.validate(error)) {
        m_error = error;
        return false;
    }

    next.m_error.clear();
    *this = next;
    return true;
}

std::string ConfigStore::toJson() const {
    json root;
    root["v"] = "0.8";
    root["sensor"] = sensor;
    root["units"] = units;
    root["collision_threshold"] = collision_threshold;
    root["turn_tolerance"] = turn_tolerance;
    root["turn_policy"] = turn_policy;
    root["averaging"] = averaging;
    root["random_seed"] = random_seed;

    root["zones"] = {
        {"left", zoneToJson(zones.left)},
        {"center", zoneToJson(zones.center)},
        {"right", zoneToJson(zones.right)}
    };

    root["drive"] = {
        {"enabled", drive_enabled},
        {"forward_left", forward_left_speed},
        {"forward_right", forward_right_speed},
        {"forward_left_offset", forward_left_offset},
        {"forward_right_offset", forward_right_offset},
        {"turn_speed", turn_speed},
        {"backup_speed", backup_speed}
    };

    root["timing"] = {
        {"forward_poll_ms", forward_poll_ms},
        {"turn_hold_ms", turn_hold_ms},
        {"backup_pulse_ms", backup_pulse_ms},
        {"backup_pulses", backup_pulses},
        {"blink_ms", blink_ms}
    };

    root["tof"] = {
        {"resolution", tof.resolution},
        {"ranging_frequency_hz", tof.ranging_frequency_hz},
        {"integration_time_ms", tof.integration_time_ms},
        {"sharpener_percent", tof.sharpener_percent},
        {"ready_wait_ms", tof_ready_wait_ms}
    };

    root["ultrasonic"] = {
        {"readings", ultrasonic.readings},
        {"samples", ultrasonic.samples},
        {"timeout_ms", ultrasonic.timeout_ms},
        {"reading_gap_ms", ultrasonic.reading_gap_ms},
        {"retry_max", ultrasonic.retry_max}
    };

    return root.dump(2);
}

bool ConfigStore::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        m_error = "cannot write " + path;
        return false;
    }

    file << toJson() << "\n";
    return file.good();
}

TurnPolicy ConfigStore::turnPolicy() const {
    return turn_policy == "last_turn_bias" ? TurnPolicy::LAST_TURN_BIAS : TurnPolicy::GEOMETRIC;
}

AveragingMode ConfigStore::averagingMode() const {
    return averaging == "round" ? AveragingMode::ROUND : AveragingMode::TRUNCATE;
}

int ConfigStore::frameDim() const {
    if (isUltrasonic()) return FRAME_DIM_ULTRASONIC;
    return tof.resolution == 16 ? 4 : FRAME_DIM_TOF;
}

MotionController::Profile ConfigStore::motionProfile() const {
    MotionController::Profile p;
    p.collision_threshold = collision_threshold;
    p.turn_tolerance = turn_tolerance;
    p.zones = zones;
    p.drive_enabled = drive_enabled;
    p.forward_left = forward_left_speed + forward_left_offset;
    p.forward_right = forward_right_speed + forward_right_offset;
    p.turn_speed = turn_speed;
    p.backup_speed = backup_speed;
    p.forward_poll_ms = forward_poll_ms;
    p.turn_hold_ms = turn_hold_ms;
    p.backup_pulse_ms = backup_pulse_ms;
    p.backup_pulses = backup_pulses;
    p.blink_ms = blink_ms;
    p.random_seed = random_seed;
    return p;
}

bool ConfigStore::validate(std::string& error) const {
    if (sensor != "tof" && sensor != "ultrasonic") {
        error = "sensor must be \"tof\" or \"ultrasonic\"";
        return false;
    }
    if (units != "mm" && units != "cm") {
        error = "units must be \"mm\" or \"cm\"";
        return false;
    }
    if ((sensor == "tof" && units != "mm") || (sensor == "ultrasonic" && units != "cm")) {
        error = "units \"" + units + "\" do not match the " + sensor + " sensor";
        return false;
    }
    if (turn_policy != "geometric" && turn_policy != "last_turn_bias") {
        error = "turn_policy must be \"geometric\" or \"last_turn_bias\"";
        return false;
    }
    if (averaging != "truncate" && averaging != "round") {
        error = "averaging must be \"truncate\" or \"round\"";
        return false;
    }
    if (collision_threshold < 0 || collision_threshold > DISTANCE_MAX ||
        turn_tolerance < 0 || turn_tolerance > DISTANCE_MAX) {
        error = "collision_threshold and turn_tolerance must be in [0, " +
                std::to_string(DISTANCE_MAX) + "]";
        return false;
    }
    if (tof.resolution != 16 && tof.resolution != 64) {
        error = "tof.resolution must be 16 or 64";
        return false;
    }

    int dim = frameDim();
    const ZoneSpec* all[] = {&zones.left, &zones.center, &zones.right};
    for (const ZoneSpec* zone : all) {
        if (!ZoneExtractor::fits(*zone, dim, dim)) {
            error = "zone \"" + zone->name + "\" does not fit a " +
                    std::to_string(dim) + "x" + std::to_string(dim) + " frame";
            return false;
        }
    }

    if (!speedInRange(forward_left_speed + forward_left_offset) ||
        !speedInRange(forward_right_speed + forward_right_offset) ||
        !speedInRange(turn_speed) || !speedInRange(backup_speed)) {
        error = "drive speeds must lie in [-1.0, 1.0]";
        return false;
    }
    if (backup_pulses < 0 || backup_pulses > CONFIG_COUNT_MAX) {
        error = "backup_pulses must be in [0, " + std::to_string(CONFIG_COUNT_MAX) + "]";
        return false;
    }

    const uint32_t durations[] = {
        forward_poll_ms, turn_hold_ms, backup_pulse_ms, blink_ms, tof_ready_wait_ms,
        ultrasonic.timeout_ms, ultrasonic.reading_gap_ms
    };
    for (uint32_t ms : durations) {
        if (ms > CONFIG_DURATION_MAX_MS) {
            error = "durations must not exceed " + std::to_string(CONFIG_DURATION_MAX_MS) + " ms";
            return false;
        }
    }
    if (ultrasonic.readings <= 0 || ultrasonic.retry_max <= 0) {
        error = "ultrasonic.readings and ultrasonic.retry_max must be positive";
        return false;
    }

    return true;
}
