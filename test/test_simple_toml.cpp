// ============= test/test_simple_toml.cpp =============
//
// Lector TOML + mapeo a AppConfig
//

#include "quickroll/app_config.hpp"
#include "quickroll/simple_toml.hpp"
#include "test_common.hpp"

using namespace quickroll;

void test_sections_and_types() {
    SimpleToml toml;
    CHECK(toml.parse(R"(
# comentario
[camera]
source = "rtsp://10.0.0.2/stream"   # url
mirror = false

[tracking]
detection_interval = 7
iou_threshold = 0.45
)"));

    CHECK(toml.get("camera.source") == "rtsp://10.0.0.2/stream");
    CHECK(toml.get_bool("camera.mirror", true) == false);
    CHECK(toml.get_int("tracking.detection_interval") == 7);
    CHECK_NEAR(toml.get_float("tracking.iou_threshold"), 0.45f, 1e-6f);
    CHECK(!toml.has("camera.retries"));
}

void test_defaults_on_missing_or_invalid() {
    SimpleToml toml;
    toml.parse("[a]\nnumber = abc\nflag = maybe\n");

    CHECK(toml.get_int("a.number", 42) == 42);
    CHECK(toml.get_bool("a.flag", true) == true);
    CHECK(toml.get_bool("a.missing", true) == true);
    CHECK(toml.get("a.missing", "def") == "def");
}

void test_load_missing_file() {
    SimpleToml toml;
    CHECK(!toml.load("/nonexistent/quickroll/config.toml"));
}

void test_app_config_mapping() {
    SimpleToml toml;
    toml.parse(R"(
[camera]
mirror = true
[recognition]
high_confidence = 0.8
low_confidence = 0.55
[attendance]
cooldown_seconds = 60
[tracking]
backend = "template"
max_failures = 5
)");

    AppConfig cfg = load_app_config(toml);

    CHECK_NEAR(cfg.thresholds.high, 0.8f, 1e-6f);
    CHECK_NEAR(cfg.attendance.high_confidence, 0.8f, 1e-6f);
    CHECK_NEAR(cfg.attendance.low_confidence, 0.55f, 1e-6f);
    CHECK(cfg.attendance.cooldown_seconds == 60);
    CHECK(cfg.tracker_backend == TrackerBackend::TEMPLATE);
    CHECK(cfg.tracking.max_tracking_failures == 5);
    CHECK(cfg.tracking.detection_interval == Config::DETECTION_INTERVAL);
    CHECK(cfg.capture.mirrored);
    CHECK(cfg.db_path == Config::DEFAULT_DB_PATH);
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(spdlog::level::warn);

    RUN_TEST(test_sections_and_types);
    RUN_TEST(test_defaults_on_missing_or_invalid);
    RUN_TEST(test_load_missing_file);
    RUN_TEST(test_app_config_mapping);

    return test::test_result("test_simple_toml");
}
