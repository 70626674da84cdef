#include "quickroll/capture/pose_capture.hpp"
#include "quickroll/draw_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quickroll {

const char* to_string(CapturePose pose) {
    switch (pose) {
        case CapturePose::FRONT: return "front";
        case CapturePose::LEFT:  return "left";
        case CapturePose::RIGHT: return "right";
    }
    return "front";
}

const char* to_string(CaptureState state) {
    switch (state) {
        case CaptureState::WAITING:   return "WAITING";
        case CaptureState::CAPTURING: return "CAPTURING";
        case CaptureState::COMPLETED: return "COMPLETED";
    }
    return "WAITING";
}

const std::array<CapturePose, 3>& PoseCapture::required_poses() {
    static const std::array<CapturePose, 3> poses = {
        CapturePose::FRONT, CapturePose::LEFT, CapturePose::RIGHT
    };
    return poses;
}

PoseCapture::PoseCapture(std::shared_ptr<FaceDetector> detector,
                         std::shared_ptr<FaceEmbedder> embedder,
                         std::shared_ptr<FaceStore> store,
                         const PoseCaptureConfig& config, Clock clock)
    : detector(std::move(detector)), embedder(std::move(embedder)),
      store(std::move(store)), config(config), clock(std::move(clock)),
      current_state(CaptureState::WAITING), pose_index(0), message("Ready")
{
    if (!this->detector || !this->embedder || !this->store) {
        throw std::invalid_argument("PoseCapture requiere detector, embedder y store");
    }
    if (!this->clock) {
        this->clock = [] { return std::chrono::steady_clock::now(); };
    }

    spdlog::info("📸 Pose Capture initialized");
    spdlog::info("   Yaw: front < {:.2f}, turn > {:.2f}{}", this->config.front_yaw_limit,
                 this->config.turn_yaw_limit, this->config.mirrored ? " (mirrored)" : "");
    spdlog::info("   Intervalo entre capturas: {:.1f}s", this->config.capture_interval);
}

void PoseCapture::reset() {
    current_identity.clear();
    current_state = CaptureState::WAITING;
    pose_index = 0;
    captured_poses.clear();
    last_capture.reset();
    message = "Ready";
}

bool PoseCapture::start_session(const std::string& identity) {
    reset();

    if (identity.empty()) {
        spdlog::error("start_session: identidad vacia");
        return false;
    }

    if (!store->create_identity_storage(identity)) {
        spdlog::error("✗ No se pudo crear el almacenamiento de {}", identity);
        return false;
    }

    current_identity = identity;
    current_state = CaptureState::CAPTURING;
    update_status();

    spdlog::info("Sesion de captura iniciada: {}", identity);
    return true;
}

std::optional<CapturePose> PoseCapture::target_pose() const {
    if (current_state != CaptureState::CAPTURING || pose_index >= required_poses().size()) {
        return std::nullopt;
    }
    return required_poses()[pose_index];
}

float PoseCapture::progress() const {
    switch (current_state) {
        case CaptureState::WAITING:   return 0.0f;
        case CaptureState::COMPLETED: return 1.0f;
        case CaptureState::CAPTURING: break;
    }
    return static_cast<float>(pose_index) / required_poses().size();
}

void PoseCapture::update_status() {
    auto target = target_pose();
    if (!target) {
        current_state = CaptureState::COMPLETED;
        message = "All Captures Complete!";
        return;
    }

    switch (*target) {
        case CapturePose::FRONT: message = "Look Straight Ahead"; break;
        case CapturePose::LEFT:  message = "Turn Head LEFT (Show Right Profile)"; break;
        case CapturePose::RIGHT: message = "Turn Head RIGHT (Show Left Profile)"; break;
    }
}

cv::Rect PoseCapture::padded_box(const cv::Rect& box, const cv::Size& frame_size, float padding) {
    int pad_x = static_cast<int>(box.width * padding);
    int pad_y = static_cast<int>(box.height * padding);

    cv::Rect padded(box.x - pad_x, box.y - pad_y,
                    box.width + 2 * pad_x, box.height + 2 * pad_y);
    return padded & cv::Rect(0, 0, frame_size.width, frame_size.height);
}

bool PoseCapture::pose_matches(CapturePose target, float yaw) {
    switch (target) {
        case CapturePose::FRONT:
            if (std::abs(yaw) < config.front_yaw_limit) return true;
            message = "Look Straight";
            return false;
        case CapturePose::LEFT:
            if (yaw > config.turn_yaw_limit) return true;
            message = "Turn MORE Left";
            return false;
        case CapturePose::RIGHT:
            if (yaw < -config.turn_yaw_limit) return true;
            message = "Turn MORE Right";
            return false;
    }
    return false;
}

CaptureFrameResult PoseCapture::make_result(cv::Mat vis) const {
    CaptureFrameResult result;
    result.frame = vis;
    result.message = message;
    result.progress = progress();
    result.state = current_state;
    return result;
}

// ==================== PROCESS ====================

CaptureFrameResult PoseCapture::process(const cv::Mat& frame) {
    if (current_state != CaptureState::CAPTURING || frame.empty()) {
        return make_result(frame.empty() ? cv::Mat() : frame.clone());
    }

    cv::Mat vis = frame.clone();

    std::vector<Detection> faces;
    try {
        faces = detector->detect(frame);
    } catch (const std::exception& e) {
        spdlog::warn("PoseCapture: fallo del detector: {}", e.what());
    }

    for (const auto& det : faces) {
        DrawUtils::draw_detection(vis, det);
    }

    if (faces.empty()) {
        CaptureFrameResult result = make_result(vis);
        result.message = "No Face Detected";
        return result;
    }

    const Detection& face = *std::max_element(
        faces.begin(), faces.end(),
        [](const Detection& a, const Detection& b) { return a.box.area() < b.box.area(); });

    // 1. Calidad
    QualityReport quality = FaceValidator::check_quality(frame, face.box, config.quality);
    if (!quality.passed) {
        CaptureFrameResult result = make_result(vis);
        result.message = "Quality: " + FaceValidator::join_issues(quality.issues);
        result.issues = quality.issues;
        return result;
    }

    // 2. Pose
    float yaw = FaceValidator::estimate_yaw(face);
    if (config.mirrored) yaw = -yaw;

    CapturePose target = *target_pose();
    update_status();
    bool pose_ok = pose_matches(target, yaw);

    // 3. Auto-captura
    bool captured_now = false;
    if (pose_ok) {
        auto now = clock();
        bool interval_ok = !last_capture ||
            std::chrono::duration<double>(now - *last_capture).count() >= config.capture_interval;

        if (interval_ok && capture(frame, face, target)) {
            last_capture = now;
            captured_now = true;
            DrawUtils::draw_capture_flash(vis);
        }
    }

    CaptureFrameResult result = make_result(vis);
    result.captured = captured_now;
    result.yaw = yaw;
    return result;
}

bool PoseCapture::capture(const cv::Mat& frame, const Detection& face, CapturePose target) {
    cv::Rect crop = padded_box(face.box, frame.size(), config.padding);
    if (crop.area() <= 0) {
        return false;
    }

    auto path = store->save_captured_image(current_identity, frame(crop).clone(), to_string(target));
    if (!path) {
        spdlog::error("✗ No se pudo guardar la pose {} de {}", to_string(target), current_identity);
        message = "Save Failed - Retrying";
        return false;
    }

    spdlog::info("✓ [CAPTURE] {} guardada para {}", to_string(target), current_identity);
    captured_poses[target] = *path;

    // Embedding alineado con el frame completo + landmarks
    Embedding embedding;
    try {
        embedding = embedder->embed(frame, &face);
    } catch (const std::exception& e) {
        spdlog::warn("Embedder fallo en la pose {}: {}", to_string(target), e.what());
    }
    if (embedding.empty()) {
        spdlog::warn("Sin embedding para la pose {} de {}", to_string(target), current_identity);
    } else if (!store->add_embedding(current_identity, embedding, to_string(target))) {
        spdlog::error("✗ No se pudo guardar el embedding {} de {}", to_string(target), current_identity);
    } else {
        spdlog::info("✓ [DB] embedding {} guardado", to_string(target));
    }

    pose_index++;
    update_status();
    return true;
}

}  // namespace quickroll
