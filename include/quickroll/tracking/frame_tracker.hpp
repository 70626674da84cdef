// ============= include/quickroll/tracking/frame_tracker.hpp =============
/*
 * Frame Tracker - deteccion + tracking hibrido
 *
 * ESTRATEGIA:
 * - Deteccion completa cada detection_interval frames (o si no hay tracks)
 * - Tracking visual barato en los frames intermedios
 * - Reconocimiento cada recognition_interval frames y SIEMPRE despues de
 *   una deteccion (landmarks frescos -> embedding alineado)
 *
 * ASOCIACION:
 * - IoU track/deteccion, greedy global (mayor IoU primero), uno a uno,
 *   solo pares con IoU > 0.3
 * - Tracks sin deteccion desaparecen en el frame de deteccion
 * - En frames de tracking: max_tracking_failures fallos seguidos -> fuera
 * - Si el detector lanza excepcion los tracks quedan intactos y no se
 *   reconoce con landmarks viejos
 *
 * IDs:
 * - Monotonicos, nunca se reutilizan (ni despues de reset())
 *
 * NO es thread-safe: un FrameTracker por stream.
 */

#pragma once
#include "quickroll/core/types.hpp"
#include "quickroll/config.hpp"
#include "quickroll/detection/face_detector.hpp"
#include "quickroll/recognition/similarity_classifier.hpp"
#include "quickroll/tracking/identity_track.hpp"
#include "quickroll/tracking/visual_tracker.hpp"
#include "quickroll/utils.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quickroll {

struct FrameTrackerConfig {
    int detection_interval = Config::DETECTION_INTERVAL;
    int recognition_interval = Config::RECOGNITION_INTERVAL;
    int max_tracking_failures = Config::MAX_TRACKING_FAILURES;
    float iou_threshold = Config::IOU_THRESHOLD;
    int crop_padding = Config::RECOGNITION_CROP_PADDING;
};

struct TrackResult {
    int track_id = -1;
    cv::Rect box;
    std::string identity;                 // vacio si UNKNOWN / pendiente
    std::string name;
    RecognitionStatus status = RecognitionStatus::UNKNOWN;
    float confidence = 0.0f;
    bool from_detection = false;          // box de deteccion fresca vs tracker
    bool pending = true;                  // todavia sin reconocimiento
};

class FrameTracker {
public:
    FrameTracker(std::shared_ptr<FaceDetector> detector,
                 std::shared_ptr<SimilarityClassifier> classifier,
                 const FrameTrackerConfig& config = FrameTrackerConfig(),
                 TrackerFactory tracker_factory = TrackerFactory());

    std::vector<TrackResult> process(const cv::Mat& frame);
    void reset();

    size_t track_count() const { return tracks.size(); }
    int frame_count() const { return frames; }
    double fps() const { return fps_counter.current(); }

    static float compute_iou(const cv::Rect& a, const cv::Rect& b);

private:
    std::shared_ptr<FaceDetector> detector;
    std::shared_ptr<SimilarityClassifier> classifier;
    FrameTrackerConfig config;
    TrackerFactory tracker_factory;

    std::map<int, IdentityTrack> tracks;   // track id -> track
    int frames;
    int next_id;
    FpsCounter fps_counter;

    // false si el detector fallo: tracks intactos
    bool run_detection(const cv::Mat& frame);
    void run_tracking(const cv::Mat& frame);
    void run_recognition(const cv::Mat& frame, bool use_landmarks);

    std::vector<TrackResult> collect() const;
};

}  // namespace quickroll
