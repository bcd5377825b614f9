/**
 * Configuration Store Unit Tests
 */

#include <cstdio>
#include <cstdint>
#include <string>
#include "../src/config_store.h"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

static const char* ULTRASONIC_CONFIG = R"({
    "sensor": "ultrasonic",
    "units": "cm",
    "collision_threshold": 20,
    "zones": {
        "left": [0, 0, 0, 0],
        "center": [0, 0, 0, 0],
        "right": [0, 0, 0, 0]
    }
})";

void test_defaults() {
    TEST("Defaults are a valid ToF setup");

    ConfigStore config;
    std::string error;
    bool ok = config.validate(error);
    ok = ok && config.sensor == "tof" && config.units == "mm";
    ok = ok && config.collision_threshold == 200 && config.turn_tolerance == 1;
    ok = ok && config.frameDim() == 8 && !config.isUltrasonic();
    ok = ok && config.turnPolicy() == TurnPolicy::GEOMETRIC;
    ok = ok && config.averagingMode() == AveragingMode::TRUNCATE;
    ok = ok && config.zones.center.start_row == 2 && config.zones.center.end_col == 5;
    ok = ok && config.zones.right.start_col == 6 && config.zones.right.end_col == 7;
    ok = ok && config.backup_pulses == 5 && config.tof.resolution == 64;
    ok = ok && config.ultrasonic.retry_max == 10;

    if (ok) {
        PASS();
    } else {
        FAIL(error.empty() ? "Unexpected default" : error.c_str());
    }
}

void test_partial_override() {
    TEST("Missing keys keep their defaults");

    ConfigStore config;
    bool ok = config.parseJson(R"({
        "collision_threshold": 150,
        "turn_policy": "last_turn_bias",
        "averaging": "round",
        "drive": { "turn_speed": 0.3 },
        "timing": { "backup_pulses": 3 }
    })");

    ok = ok && config.collision_threshold == 150;
    ok = ok && config.turnPolicy() == TurnPolicy::LAST_TURN_BIAS;
    ok = ok && config.averagingMode() == AveragingMode::ROUND;
    ok = ok && config.turn_speed == 0.3f;
    ok = ok && config.backup_speed == 0.45f;
    ok = ok && config.backup_pulses == 3;
    ok = ok && config.backup_pulse_ms == 150;
    ok = ok && config.turn_tolerance == 1;

    if (ok) {
        PASS();
    } else {
        FAIL(config.lastError().empty() ? "Override wrong" : config.lastError().c_str());
    }
}

void test_ultrasonic_setup() {
    TEST("Ultrasonic setup uses cm and single-cell zones");

    ConfigStore config;
    bool ok = config.parseJson(ULTRASONIC_CONFIG);
    ok = ok && config.isUltrasonic() && config.frameDim() == 1;
    ok = ok && config.units == "cm" && config.collision_threshold == 20;
    ok = ok && config.zones.left.end_row == 0 && config.zones.right.end_col == 0;

    if (ok) {
        PASS();
    } else {
        FAIL(config.lastError().empty() ? "Ultrasonic setup rejected" : config.lastError().c_str());
    }
}

void test_rejects_unit_mismatch() {
    TEST("Units that do not match the sensor are rejected");

    ConfigStore config;
    bool ok = true;
    ok = ok && !config.parseJson(R"({"units": "cm"})");
    ok = ok && !config.parseJson(R"({
        "sensor": "ultrasonic",
        "zones": { "left": [0,0,0,0], "center": [0,0,0,0], "right": [0,0,0,0] }
    })");
    ok = ok && !config.parseJson(R"({"units": "inch"})");
    ok = ok && !config.parseJson(R"({"sensor": "lidar"})");

    // Rejected documents leave the store untouched
    ok = ok && config.sensor == "tof" && config.units == "mm";

    if (ok) {
        PASS();
    } else {
        FAIL("Mixed units accepted");
    }
}

void test_rejects_zone_outside_frame() {
    TEST("Zones must fit the sensor grid");

    ConfigStore config;
    bool ok = true;
    ok = ok && !config.parseJson(R"({"zones": {"right": [0, 6, 7, 8]}})");
    ok = ok && !config.parseJson(R"({"zones": {"left": [3, 0, 2, 1]}})");
    ok = ok && !config.parseJson(R"({"zones": {"center": [2, 2, 5]}})");
    // Standard 8x8 zones do not fit the 4x4 mode
    ok = ok && !config.parseJson(R"({"tof": {"resolution": 16}})");
    // Standard zones do not fit the ultrasonic single cell
    ok = ok && !config.parseJson(R"({"sensor": "ultrasonic", "units": "cm"})");
    ok = ok && config.zones.right.end_col == 7;

    bool accepted = config.parseJson(R"({
        "tof": {"resolution": 16},
        "zones": {"left": [0,0,3,0], "center": [1,1,2,2], "right": [0,3,3,3]}
    })");
    ok = ok && accepted && config.frameDim() == 4;

    if (ok) {
        PASS();
    } else {
        FAIL("Zone bounds not checked against the grid");
    }
}

void test_rejects_bad_values() {
    TEST("Out-of-range and malformed values are rejected");

    const char* bad[] = {
        "{not json",
        "[1, 2]",
        R"({"collision_threshold": -1})",
        R"({"turn_tolerance": -5})",
        R"({"collision_threshold": "near"})",
        R"({"turn_policy": "always_left"})",
        R"({"averaging": "median"})",
        R"({"tof": {"resolution": 32}})",
        R"({"drive": {"turn_speed": 1.5}})",
        R"({"drive": {"forward_left": 0.8, "forward_left_offset": 0.5}})",
        R"({"timing": {"backup_pulses": -1}})",
        R"({"ultrasonic": {"retry_max": 0}})",
        R"({"timing": {"backup_pulses": 1.5}})",
        R"({"timing": [250]})",
    };

    for (const char* doc : bad) {
        ConfigStore config;
        if (config.parseJson(doc) || config.lastError().empty()) {
            char buf[128];
            snprintf(buf, sizeof(buf), "accepted: %s", doc);
            FAIL(buf);
            return;
        }
        if (config.collision_threshold != 200 || config.turn_policy != "geometric") {
            FAIL("Rejected document changed the store");
            return;
        }
    }
    PASS();
}

void test_rejects_wrapping_values() {
    TEST("Negative or oversized integers are rejected, not wrapped");

    const char* bad[] = {
        R"({"timing": {"forward_poll_ms": -1}})",
        R"({"timing": {"turn_hold_ms": -1}})",
        R"({"timing": {"backup_pulse_ms": 4294967296}})",
        R"({"timing": {"blink_ms": 18446744073709551615}})",
        R"({"timing": {"forward_poll_ms": 60001}})",
        R"({"random_seed": -5})",
        R"({"random_seed": 4294967296})",
        R"({"turn_tolerance": 2147483647})",
        R"({"collision_threshold": 4294967496})",
        R"({"collision_threshold": 70000})",
        R"({"tof": {"ready_wait_ms": -1}})",
        R"({"tof": {"resolution": 4294967360}})",
        R"({"ultrasonic": {"timeout_ms": -3}})",
        R"({"ultrasonic": {"readings": -10}})",
        R"({"zones": {"right": [0, 6, 7, 4294967303]}})",
        R"({"zones": {"left": [-4294967296, 0, 7, 1]}})",
    };

    for (const char* doc : bad) {
        ConfigStore config;
        if (config.parseJson(doc)) {
            char buf[128];
            snprintf(buf, sizeof(buf), "accepted: %s", doc);
            FAIL(buf);
            return;
        }
        if (config.forward_poll_ms != 250 || config.turn_hold_ms != 450 ||
            config.random_seed != 0 || config.turn_tolerance != 1) {
            FAIL("Rejected document changed the store");
            return;
        }
    }

    // Limits themselves are fine
    ConfigStore edge;
    bool ok = edge.parseJson(R"({
        "random_seed": 4294967295,
        "collision_threshold": 65535,
        "timing": {"forward_poll_ms": 60000, "turn_hold_ms": 0}
    })");
    ok = ok && edge.random_seed == 4294967295u && edge.forward_poll_ms == 60000;
    ok = ok && edge.turn_hold_ms == 0 && edge.collision_threshold == 65535;

    // Values set in code go through the same bounds
    ConfigStore direct;
    std::string error;
    direct.forward_poll_ms = 4000000000u;
    ok = ok && !direct.validate(error);
    direct.forward_poll_ms = 250;
    direct.turn_tolerance = 2147483647;
    ok = ok && !direct.validate(error);

    if (ok) {
        PASS();
    } else {
        FAIL(edge.lastError().empty() ? "Boundary values wrong" : edge.lastError().c_str());
    }
}

void test_motion_profile() {
    TEST("Motion profile folds in the forward offsets");

    ConfigStore config;
    bool ok = config.parseJson(R"({
        "collision_threshold": 120,
        "random_seed": 7,
        "drive": { "enabled": false, "forward_right_offset": -0.25 },
        "timing": { "turn_hold_ms": 300, "blink_ms": 100 }
    })");

    MotionController::Profile p = config.motionProfile();
    ok = ok && p.collision_threshold == 120;
    ok = ok && p.forward_left == 0.50f && p.forward_right == 0.25f;
    ok = ok && !p.drive_enabled;
    ok = ok && p.turn_hold_ms == 300 && p.blink_ms == 100;
    ok = ok && p.random_seed == 7;
    ok = ok && p.zones.center.start_row == 2;

    if (ok) {
        PASS();
    } else {
        FAIL("Profile fields wrong");
    }
}

void test_json_roundtrip() {
    TEST("toJson output parses back to the same settings");

    ConfigStore a;
    bool ok = a.parseJson(ULTRASONIC_CONFIG);
    a.turn_tolerance = 4;
    a.ultrasonic.readings = 6;
    a.forward_poll_ms = 100;

    ConfigStore b;
    ok = ok && b.parseJson(a.toJson());
    ok = ok && b.sensor == "ultrasonic" && b.units == "cm";
    ok = ok && b.turn_tolerance == 4 && b.ultrasonic.readings == 6;
    ok = ok && b.forward_poll_ms == 100 && b.collision_threshold == 20;
    ok = ok && b.zones.center.end_col == 0;

    if (ok) {
        PASS();
    } else {
        FAIL(b.lastError().empty() ? "Settings lost" : b.lastError().c_str());
    }
}

void test_save_and_load() {
    TEST("save then load through a file");

    const std::string path = "test_config_store.json";

    ConfigStore a;
    a.collision_threshold = 321;
    a.turn_policy = "last_turn_bias";
    bool ok = a.save(path);

    ConfigStore b;
    ok = ok && b.load(path);
    ok = ok && b.collision_threshold == 321;
    ok = ok && b.turnPolicy() == TurnPolicy::LAST_TURN_BIAS;
    std::remove(path.c_str());

    ConfigStore c;
    ok = ok && !c.load("does/not/exist.json") && !c.lastError().empty();

    if (ok) {
        PASS();
    } else {
        FAIL("File round trip failed");
    }
}

int main() {
    printf("=== Config Store Tests ===\n");

    test_defaults();
    test_partial_override();
    test_ultrasonic_setup();
    test_rejects_unit_mismatch();
    test_rejects_zone_outside_frame();
    test_rejects_bad_values();
    test_rejects_wrapping_values();
    test_motion_profile();
    test_json_roundtrip();
    test_save_and_load();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
