#include "quickroll/app_config.hpp"
#include <spdlog/spdlog.h>

namespace quickroll {

AppConfig load_app_config(const SimpleToml& toml) {
    AppConfig cfg;

    cfg.source = toml.get("camera.source", cfg.source);
    cfg.mirror = toml.get_bool("camera.mirror", cfg.mirror);
    cfg.retries = toml.get_int("camera.retries", cfg.retries);

    cfg.detector.model_path = toml.get("models.detector", cfg.detector.model_path);
    cfg.detector.score_threshold = toml.get_float("models.score_threshold", cfg.detector.score_threshold);
    cfg.detector.nms_threshold = toml.get_float("models.nms_threshold", cfg.detector.nms_threshold);
    cfg.detector.top_k = toml.get_int("models.top_k", cfg.detector.top_k);
    cfg.recognizer_model = toml.get("models.recognizer", cfg.recognizer_model);

    cfg.db_path = toml.get("database.path", cfg.db_path);
    cfg.image_root = toml.get("database.image_root", cfg.image_root);

    cfg.thresholds.high = toml.get_float("recognition.high_confidence", cfg.thresholds.high);
    cfg.thresholds.low = toml.get_float("recognition.low_confidence", cfg.thresholds.low);
    cfg.thresholds.min = toml.get_float("recognition.min_confidence", cfg.thresholds.min);

    cfg.tracking.detection_interval = toml.get_int("tracking.detection_interval", cfg.tracking.detection_interval);
    cfg.tracking.recognition_interval = toml.get_int("tracking.recognition_interval", cfg.tracking.recognition_interval);
    cfg.tracking.max_tracking_failures = toml.get_int("tracking.max_failures", cfg.tracking.max_tracking_failures);
    cfg.tracking.iou_threshold = toml.get_float("tracking.iou_threshold", cfg.tracking.iou_threshold);
    cfg.tracking.crop_padding = toml.get_int("tracking.crop_padding", cfg.tracking.crop_padding);
    cfg.tracker_backend = parse_tracker_backend(toml.get("tracking.backend", "auto"));

    // Asistencia usa las mismas bandas que el reconocimiento
    cfg.attendance.cooldown_seconds = toml.get_int("attendance.cooldown_seconds", cfg.attendance.cooldown_seconds);
    cfg.attendance.high_confidence = cfg.thresholds.high;
    cfg.attendance.low_confidence = cfg.thresholds.low;

    cfg.capture.quality.min_face_size = toml.get_int("capture.min_face_size", cfg.capture.quality.min_face_size);
    cfg.capture.quality.blur_threshold = toml.get_float("capture.blur_threshold",
                                                        static_cast<float>(cfg.capture.quality.blur_threshold));
    cfg.capture.quality.dark_threshold = toml.get_float("capture.dark_threshold",
                                                        static_cast<float>(cfg.capture.quality.dark_threshold));
    cfg.capture.quality.bright_threshold = toml.get_float("capture.bright_threshold",
                                                          static_cast<float>(cfg.capture.quality.bright_threshold));
    cfg.capture.front_yaw_limit = toml.get_float("capture.front_yaw_limit", cfg.capture.front_yaw_limit);
    cfg.capture.turn_yaw_limit = toml.get_float("capture.turn_yaw_limit", cfg.capture.turn_yaw_limit);
    cfg.capture.capture_interval = toml.get_float("capture.interval_sec",
                                                  static_cast<float>(cfg.capture.capture_interval));
    cfg.capture.padding = toml.get_float("capture.padding", cfg.capture.padding);
    // El frame espejado invierte el signo del yaw
    cfg.capture.mirrored = cfg.mirror;

    cfg.display = toml.get_bool("output.display", cfg.display);
    cfg.display_width = toml.get_int("output.display_width", cfg.display_width);
    cfg.display_height = toml.get_int("output.display_height", cfg.display_height);
    cfg.draw_fps = toml.get_bool("output.draw_fps", cfg.draw_fps);
    cfg.log_level = toml.get("output.log_level", cfg.log_level);

    return cfg;
}

void log_app_config(const AppConfig& cfg) {
    spdlog::info("Configuracion:");
    spdlog::info("  camara: {} (mirror: {})", cfg.source, cfg.mirror ? "si" : "no");
    spdlog::info("  detector: {}", cfg.detector.model_path);
    spdlog::info("  recognizer: {}", cfg.recognizer_model);
    spdlog::info("  database: {} | imagenes: {}", cfg.db_path, cfg.image_root);
    spdlog::info("  umbrales: HIGH={:.2f} LOW={:.2f} MIN={:.2f}",
                 cfg.thresholds.high, cfg.thresholds.low, cfg.thresholds.min);
    spdlog::info("  cooldown: {}s", cfg.attendance.cooldown_seconds);
}

}  // namespace quickroll
