// ============= main.cpp - QuickRoll: asistencia + enrolamiento =============
//
// USO:
//   ./quickroll [config.toml]                     asistencia en vivo
//   ./quickroll [config.toml] enroll <id> <name>  captura guiada de 3 poses
//
// TECLAS:
//   ESC / q  salir
//   r        recargar identidades (asistencia) / reiniciar sesion (enroll)
//   m        espejo on/off (solo asistencia; enroll usa camera.mirror)
//
#include "quickroll/app_config.hpp"
#include "quickroll/attendance/attendance_engine.hpp"
#include "quickroll/capture/pose_capture.hpp"
#include "quickroll/database/face_store.hpp"
#include "quickroll/detection/face_detector.hpp"
#include "quickroll/draw_utils.hpp"
#include "quickroll/recognition/face_embedder.hpp"
#include "quickroll/recognition/similarity_classifier.hpp"
#include "quickroll/simple_toml.hpp"
#include "quickroll/tracking/frame_tracker.hpp"
#include "quickroll/utils.hpp"
#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <atomic>
#include <csignal>
#include <memory>
#include <string>

using namespace quickroll;

std::atomic<bool> stop_signal(false);

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        spdlog::info("Deteniendo");
        stop_signal = true;
    }
}

namespace {

bool is_quit_key(int key) {
    return key == 27 || key == 'q';
}

void show(const std::string& window, const cv::Mat& frame, const AppConfig& cfg) {
    if (!cfg.display) return;

    cv::Mat display;
    cv::resize(frame, display, cv::Size(cfg.display_width, cfg.display_height));
    cv::imshow(window, display);
}

// ==================== ATTENDANCE ====================

int run_attendance(const AppConfig& cfg,
                   std::shared_ptr<FaceDetector> detector,
                   std::shared_ptr<FaceEmbedder> embedder,
                   std::shared_ptr<SqliteFaceStore> store) {
    auto classifier = std::make_shared<SimilarityClassifier>(embedder, cfg.thresholds);
    if (!classifier->reload_from(*store)) {
        spdlog::warn("⚠️ No hay identidades enroladas; todos seran Unknown");
    }

    FrameTracker tracker(detector, classifier, cfg.tracking, make_tracker_factory(cfg.tracker_backend));
    AttendanceEngine attendance(store, cfg.attendance);

    cv::VideoCapture cap = open_camera(cfg.source, cfg.retries);

    const std::string window_name = "QuickRoll - Attendance";
    if (cfg.display) {
        cv::namedWindow(window_name, cv::WINDOW_NORMAL);
        cv::resizeWindow(window_name, cfg.display_width, cfg.display_height);
    }

    bool mirror = cfg.mirror;
    cv::Mat frame;
    int read_failures = 0;

    while (!stop_signal) {
        ReadStatus status = read_frame(cap, frame, read_failures);
        if (status == ReadStatus::END) break;
        if (status == ReadStatus::RETRY) continue;
        if (mirror) {
            cv::flip(frame, frame, 1);
        }

        auto results = tracker.process(frame);
        cv::Mat vis = frame.clone();

        for (const auto& r : results) {
            std::string label;
            RecognitionStatus shown = r.status;

            switch (r.status) {
                case RecognitionStatus::RECOGNIZED: {
                    AttendanceDecision decision = attendance.decide(r.identity, r.confidence);
                    if (decision.action == AttendanceAction::COOLDOWN) {
                        shown = RecognitionStatus::COOLDOWN;
                        label = fmt::format("{} - RECORDED ({:.0f}%)", r.name, r.confidence * 100);
                        break;
                    }
                    if (decision.action == AttendanceAction::AUTO_MARK) {
                        MarkResult marked = attendance.mark(r.identity, r.name, r.confidence);
                        label = marked.success
                            ? fmt::format("{} - PRESENT ({:.0f}%)", r.name, r.confidence * 100)
                            : fmt::format("{} ({:.0f}%)", r.name, r.confidence * 100);
                        if (!marked.success) {
                            spdlog::warn("{}: {}", r.identity, marked.message);
                        }
                        break;
                    }
                    label = fmt::format("{} ({:.0f}%)", r.name, r.confidence * 100);
                    break;
                }
                case RecognitionStatus::MAYBE: {
                    AttendanceDecision decision = attendance.decide(r.identity, r.confidence);
                    if (decision.action == AttendanceAction::COOLDOWN) {
                        shown = RecognitionStatus::COOLDOWN;
                        label = fmt::format("{} - RECORDED ({:.0f}%)", r.name, r.confidence * 100);
                        break;
                    }
                    label = fmt::format("Maybe: {}? ({:.0f}%)", r.name, r.confidence * 100);
                    break;
                }
                case RecognitionStatus::UNKNOWN:
                case RecognitionStatus::COOLDOWN:
                case RecognitionStatus::NO_FACE:
                    label = r.confidence > 0 && !r.pending
                        ? fmt::format("{} ({:.0f}%)", r.name, r.confidence * 100)
                        : r.name;
                    break;
            }

            DrawUtils::draw_face_box(vis, r.box, label, r.confidence,
                                     DrawUtils::status_color(shown), r.from_detection);
        }

        ConfidenceStats stats = attendance.confidence_stats();
        DrawUtils::draw_text_with_background(vis, fmt::format("Today: {}", attendance.todays_count()),
                                             cv::Point(10, 30), cv::Scalar(0, 255, 0), cv::Scalar(0, 0, 0));
        if (stats.mean_confidence > 0) {
            DrawUtils::draw_text_with_background(
                vis, fmt::format("Avg: {:.0f}% | High: {}", stats.mean_confidence * 100, stats.high_count),
                cv::Point(10, 60), cv::Scalar(255, 255, 255), cv::Scalar(0, 0, 0));
        }
        if (cfg.draw_fps) {
            DrawUtils::draw_fps_counter(vis, tracker.fps(), cv::Point(10, vis.rows - 20));
        }

        show(window_name, vis, cfg);

        int key = cfg.display ? cv::waitKey(1) : -1;
        if (is_quit_key(key)) break;
        if (key == 'r') {
            classifier->reload_from(*store);
        } else if (key == 'm') {
            mirror = !mirror;
            // Las coordenadas cambian: los tracks viejos no sirven
            tracker.reset();
            spdlog::info("Espejo: {}", mirror ? "on" : "off");
        }
    }

    ConfidenceStats stats = attendance.confidence_stats();
    spdlog::info("Asistencia de hoy: {} registros (media {:.2f}, altos {}, bajos {})",
                 attendance.todays_count(), stats.mean_confidence, stats.high_count, stats.low_count);
    return 0;
}

// ==================== ENROLL ====================

int run_enroll(const AppConfig& cfg,
               std::shared_ptr<FaceDetector> detector,
               std::shared_ptr<FaceEmbedder> embedder,
               std::shared_ptr<SqliteFaceStore> store,
               const std::string& id, const std::string& name) {
    if (!store->add_identity(id, name)) {
        spdlog::error("No se pudo registrar {} ({})", name, id);
        return 1;
    }

    PoseCapture capture(detector, embedder, store, cfg.capture);
    if (!capture.start_session(id)) {
        return 1;
    }

    cv::VideoCapture cap = open_camera(cfg.source, cfg.retries);

    const std::string window_name = "QuickRoll - Enroll " + id;
    if (cfg.display) {
        cv::namedWindow(window_name, cv::WINDOW_NORMAL);
        cv::resizeWindow(window_name, cfg.display_width, cfg.display_height);
    }

    cv::Mat frame;
    int read_failures = 0;
    while (!stop_signal) {
        ReadStatus status = read_frame(cap, frame, read_failures);
        if (status == ReadStatus::END) break;
        if (status == ReadStatus::RETRY) continue;
        if (cfg.mirror) {
            cv::flip(frame, frame, 1);
        }

        CaptureFrameResult result = capture.process(frame);
        cv::Mat vis = result.frame.empty() ? frame.clone() : result.frame;

        cv::Scalar color = result.state == CaptureState::COMPLETED ? cv::Scalar(0, 255, 0)
                         : result.issues.empty() ? cv::Scalar(0, 255, 255)
                         : cv::Scalar(0, 0, 255);
        DrawUtils::draw_status_message(vis, result.message, color);
        DrawUtils::draw_progress_bar(vis, result.progress, cv::Rect(10, 10, vis.cols / 3, 14));

        show(window_name, vis, cfg);

        int key = cfg.display ? cv::waitKey(1) : -1;
        if (is_quit_key(key)) break;
        if (key == 'r') {
            capture.start_session(id);
        }

        if (result.state == CaptureState::COMPLETED) {
            spdlog::info("✓ Enrolamiento completo: {} ({} poses)", id, capture.captured().size());
            for (const auto& [pose, path] : capture.captured()) {
                spdlog::info("   {} -> {}", to_string(pose), path);
            }
            if (cfg.display) cv::waitKey(1500);
            break;
        }
    }

    if (capture.state() != CaptureState::COMPLETED) {
        spdlog::warn("Enrolamiento de {} incompleto ({} de 3 poses)", id, capture.captured().size());
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::string config_file = argc >= 2 ? argv[1] : "config.toml";
    std::string mode = argc >= 3 ? argv[2] : "attendance";

    SimpleToml toml;
    if (!toml.load(config_file)) {
        spdlog::warn("No se pudo cargar {}, usando defaults", config_file);
    }

    AppConfig cfg = load_app_config(toml);
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));
    log_app_config(cfg);

    try {
        auto detector = std::make_shared<YuNetDetector>(cfg.detector);
        auto embedder = std::make_shared<SFaceEmbedder>(cfg.recognizer_model);
        if (!detector->is_loaded() || !embedder->is_loaded()) {
            spdlog::error("Modelos no disponibles");
            return 1;
        }

        auto store = std::make_shared<SqliteFaceStore>(cfg.db_path, cfg.image_root);

        if (mode == "enroll") {
            if (argc < 5) {
                spdlog::error("Uso: {} <config.toml> enroll <id> <name>", argv[0]);
                return 1;
            }
            return run_enroll(cfg, detector, embedder, store, argv[3], argv[4]);
        }

        if (mode != "attendance") {
            spdlog::error("Modo desconocido: {}", mode);
            return 1;
        }
        return run_attendance(cfg, detector, embedder, store);
    }
    catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}
