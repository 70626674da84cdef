#include "quickroll/tracking/frame_tracker.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace quickroll {

FrameTracker::FrameTracker(std::shared_ptr<FaceDetector> detector,
                           std::shared_ptr<SimilarityClassifier> classifier,
                           const FrameTrackerConfig& config,
                           TrackerFactory tracker_factory)
    : detector(std::move(detector)), classifier(std::move(classifier)),
      config(config), tracker_factory(std::move(tracker_factory)),
      frames(0), next_id(0), fps_counter(Config::FPS_WINDOW)
{
    if (!this->detector || !this->classifier) {
        throw std::invalid_argument("FrameTracker requiere detector y classifier");
    }
    if (this->config.detection_interval < 1) this->config.detection_interval = 1;
    if (this->config.recognition_interval < 1) this->config.recognition_interval = 1;
    if (this->config.max_tracking_failures < 1) this->config.max_tracking_failures = 1;

    if (!this->tracker_factory) {
        this->tracker_factory = make_tracker_factory(TrackerBackend::AUTO);
    }

    spdlog::info("🎯 Frame Tracker initialized");
    spdlog::info("   Detection interval: {} frames", this->config.detection_interval);
    spdlog::info("   Recognition interval: {} frames", this->config.recognition_interval);
    spdlog::info("   Max tracking failures: {}", this->config.max_tracking_failures);
    spdlog::info("   IoU threshold: {}", this->config.iou_threshold);
}

float FrameTracker::compute_iou(const cv::Rect& a, const cv::Rect& b) {
    float intersection = static_cast<float>((a & b).area());
    float union_area = static_cast<float>(a.area() + b.area()) - intersection;

    if (union_area <= 0) return 0.0f;
    return intersection / union_area;
}

// ==================== PROCESS ====================

std::vector<TrackResult> FrameTracker::process(const cv::Mat& frame) {
    if (frame.empty()) {
        spdlog::debug("FrameTracker: frame vacio, ignorado");
        return {};
    }

    frames++;
    fps_counter.update();

    bool detect_now = (frames % config.detection_interval == 0) || tracks.empty();
    bool recognize_now = (frames % config.recognition_interval == 0);

    if (detect_now) {
        if (run_detection(frame)) {
            // Siempre reconocer con landmarks frescos
            run_recognition(frame, true);
        } else if (recognize_now) {
            // Landmarks viejos: solo recorte sin alinear
            run_recognition(frame, false);
        }
    } else {
        run_tracking(frame);
        if (recognize_now) {
            run_recognition(frame, false);
        }
    }

    return collect();
}

void FrameTracker::reset() {
    tracks.clear();
    frames = 0;
    fps_counter.reset();
    // next_id no vuelve a 0: los ids nunca se reutilizan
}

// ==================== DETECTION ====================

bool FrameTracker::run_detection(const cv::Mat& frame) {
    std::vector<Detection> detections;
    try {
        detections = detector->detect(frame);
    } catch (const std::exception& e) {
        // Tracks intactos; se reintenta en la proxima deteccion
        spdlog::warn("FrameTracker: fallo del detector: {}", e.what());
        return false;
    }

    // Snapshot de boxes antes de tocar el mapa
    std::vector<std::pair<int, cv::Rect>> snapshot;
    snapshot.reserve(tracks.size());
    for (const auto& [id, track] : tracks) {
        snapshot.emplace_back(id, track.box());
    }

    // Todos los pares con IoU sobre el umbral, mayor IoU primero
    std::vector<std::tuple<float, int, size_t>> candidates;
    for (const auto& [id, box] : snapshot) {
        for (size_t d = 0; d < detections.size(); d++) {
            float iou = compute_iou(box, detections[d].box);
            if (iou > config.iou_threshold) {
                candidates.emplace_back(iou, id, d);
            }
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& a, const auto& b) {
                         return std::get<0>(a) > std::get<0>(b);
                     });

    std::map<int, IdentityTrack> next;
    std::vector<bool> det_used(detections.size(), false);

    for (const auto& [iou, id, d] : candidates) {
        if (det_used[d] || next.count(id)) continue;

        auto it = tracks.find(id);
        IdentityTrack track = std::move(it->second);
        track.refresh(frame, detections[d], frames);
        next.emplace(id, std::move(track));
        det_used[d] = true;

        spdlog::debug("Track {} <- det {} (IoU {:.2f})", id, d, iou);
    }

    for (size_t d = 0; d < detections.size(); d++) {
        if (det_used[d]) continue;

        int id = next_id++;
        IdentityTrack track(id, detections[d], tracker_factory());
        track.refresh(frame, detections[d], frames);
        next.emplace(id, std::move(track));

        spdlog::debug("Nuevo track {} en ({}, {}, {}x{})", id,
                      detections[d].box.x, detections[d].box.y,
                      detections[d].box.width, detections[d].box.height);
    }

    size_t matched = static_cast<size_t>(std::count(det_used.begin(), det_used.end(), true));
    size_t dropped = tracks.size() - matched;
    if (dropped > 0) {
        spdlog::debug("{} tracks sin deteccion descartados", dropped);
    }

    tracks = std::move(next);
    return true;
}

// ==================== TRACKING ====================

void FrameTracker::run_tracking(const cv::Mat& frame) {
    std::vector<int> to_remove;

    for (auto& [id, track] : tracks) {
        track.update_tracker(frame);
        if (track.tracking_failures() >= config.max_tracking_failures) {
            to_remove.push_back(id);
        }
    }

    for (int id : to_remove) {
        spdlog::debug("Track {} perdido ({} fallos)", id, config.max_tracking_failures);
        tracks.erase(id);
    }
}

// ==================== RECOGNITION ====================

void FrameTracker::run_recognition(const cv::Mat& frame, bool use_landmarks) {
    const cv::Rect frame_rect(0, 0, frame.cols, frame.rows);

    for (auto& [id, track] : tracks) {
        if (use_landmarks) {
            track.set_recognition(classifier->classify(frame, &track.detection()));
            continue;
        }

        // Landmarks viejos: recorte con padding y embedding sin alinear
        const cv::Rect& box = track.box();
        int pad = config.crop_padding;
        cv::Rect padded(box.x - pad, box.y - pad, box.width + 2 * pad, box.height + 2 * pad);
        cv::Rect crop = padded & frame_rect;
        if (crop.area() <= 0) continue;

        track.set_recognition(classifier->classify(frame(crop), nullptr));
    }
}

std::vector<TrackResult> FrameTracker::collect() const {
    std::vector<TrackResult> output;
    output.reserve(tracks.size());

    for (const auto& [id, track] : tracks) {
        TrackResult result;
        result.track_id = id;
        result.box = track.box();
        result.from_detection = track.from_detection();

        const auto& cached = track.cached_recognition();
        if (cached) {
            result.identity = cached->identity;
            result.name = cached->name;
            result.status = cached->status;
            result.confidence = cached->score;
            result.pending = false;
        } else {
            result.name = "Processing...";
            result.status = RecognitionStatus::UNKNOWN;
            result.pending = true;
        }

        output.push_back(result);
    }

    return output;
}

}  // namespace quickroll
