#pragma once
#include "quickroll/attendance/attendance_engine.hpp"
#include "quickroll/capture/pose_capture.hpp"
#include "quickroll/detection/face_detector.hpp"
#include "quickroll/recognition/similarity_classifier.hpp"
#include "quickroll/simple_toml.hpp"
#include "quickroll/tracking/frame_tracker.hpp"
#include "quickroll/tracking/visual_tracker.hpp"
#include <string>

namespace quickroll {

// Configuracion completa de la app, armada desde config.toml.
// Cualquier clave ausente toma el default de quickroll::Config.
struct AppConfig {
    // [camera]
    std::string source = std::to_string(Config::DEFAULT_CAMERA_INDEX);
    bool mirror = true;
    int retries = 5;

    // [models]
    YuNetDetector::Params detector;
    std::string recognizer_model = Config::DEFAULT_RECOGNIZER_MODEL;

    // [database]
    std::string db_path = Config::DEFAULT_DB_PATH;
    std::string image_root = Config::DEFAULT_IMAGE_ROOT;

    // [recognition] / [tracking] / [attendance] / [capture]
    ConfidenceThresholds thresholds;
    FrameTrackerConfig tracking;
    TrackerBackend tracker_backend = TrackerBackend::AUTO;
    AttendanceConfig attendance;
    PoseCaptureConfig capture;

    // [output]
    bool display = true;
    int display_width = Config::DEFAULT_DISPLAY_WIDTH;
    int display_height = Config::DEFAULT_DISPLAY_HEIGHT;
    bool draw_fps = true;
    std::string log_level = "info";
};

AppConfig load_app_config(const SimpleToml& toml);

void log_app_config(const AppConfig& config);

}  // namespace quickroll
