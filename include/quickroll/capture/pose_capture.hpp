// ============= include/quickroll/capture/pose_capture.hpp =============
/*
 * Pose Capture - enrolamiento guiado front -> left -> right
 *
 * ESTADOS:
 * WAITING -> start_session() -> CAPTURING -> 3 poses -> COMPLETED
 * reset() vuelve a WAITING en cualquier momento
 *
 * POR FRAME (CAPTURING):
 * 1. Deteccion; sin caras -> "No Face Detected"
 * 2. Cara mas grande por area
 * 3. Calidad (FaceValidator); falla -> "Quality: ..." y no avanza
 * 4. Yaw vs pose objetivo:
 *      front |yaw| < 0.2, left yaw > 0.4, right yaw < -0.4
 *    mirrored = true invierte el signo del yaw antes de comparar
 * 5. >= 1s desde la ultima captura: recorte +20%, imagen + embedding
 *    al store, siguiente pose, flash blanco
 *
 * COMPLETED no se resetea solo; el caller decide.
 * NO es thread-safe.
 */

#pragma once
#include "quickroll/core/types.hpp"
#include "quickroll/config.hpp"
#include "quickroll/capture/face_validator.hpp"
#include "quickroll/database/face_store.hpp"
#include "quickroll/detection/face_detector.hpp"
#include "quickroll/recognition/face_embedder.hpp"
#include <array>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quickroll {

enum class CapturePose {
    FRONT,
    LEFT,
    RIGHT
};

enum class CaptureState {
    WAITING,
    CAPTURING,
    COMPLETED
};

const char* to_string(CapturePose pose);     // "front" / "left" / "right"
const char* to_string(CaptureState state);

struct PoseCaptureConfig {
    QualityConfig quality;
    float front_yaw_limit = Config::FRONT_YAW_LIMIT;
    float turn_yaw_limit = Config::TURN_YAW_LIMIT;
    double capture_interval = Config::CAPTURE_INTERVAL_SEC;
    float padding = Config::CAPTURE_PADDING;
    bool mirrored = false;
};

struct CaptureFrameResult {
    cv::Mat frame;                       // frame con overlay
    std::string message;
    float progress = 0.0f;
    CaptureState state = CaptureState::WAITING;
    bool captured = false;               // este frame produjo una captura
    std::vector<std::string> issues;     // razones de calidad
    float yaw = 0.0f;
};

class PoseCapture {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    PoseCapture(std::shared_ptr<FaceDetector> detector,
                std::shared_ptr<FaceEmbedder> embedder,
                std::shared_ptr<FaceStore> store,
                const PoseCaptureConfig& config = PoseCaptureConfig(),
                Clock clock = Clock());

    bool start_session(const std::string& identity);
    CaptureFrameResult process(const cv::Mat& frame);
    void reset();

    CaptureState state() const { return current_state; }
    std::optional<CapturePose> target_pose() const;
    const std::string& identity() const { return current_identity; }
    const std::string& status_message() const { return message; }

    // pose -> ruta de la imagen guardada
    const std::map<CapturePose, std::string>& captured() const { return captured_poses; }
    float progress() const;

    static const std::array<CapturePose, 3>& required_poses();

    // Box expandido padding*w / padding*h por lado, recortado al frame
    static cv::Rect padded_box(const cv::Rect& box, const cv::Size& frame_size, float padding);

private:
    std::shared_ptr<FaceDetector> detector;
    std::shared_ptr<FaceEmbedder> embedder;
    std::shared_ptr<FaceStore> store;
    PoseCaptureConfig config;
    Clock clock;

    std::string current_identity;
    CaptureState current_state;
    size_t pose_index;
    std::map<CapturePose, std::string> captured_poses;
    std::optional<std::chrono::steady_clock::time_point> last_capture;
    std::string message;

    void update_status();
    bool pose_matches(CapturePose target, float yaw);
    bool capture(const cv::Mat& frame, const Detection& face, CapturePose target);
    CaptureFrameResult make_result(cv::Mat vis) const;
};

}  // namespace quickroll
