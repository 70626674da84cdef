#pragma once
#include "quickroll/core/types.hpp"
#include "quickroll/recognition/similarity_classifier.hpp"
#include "quickroll/tracking/visual_tracker.hpp"
#include <memory>
#include <optional>

namespace quickroll {

// Una cara seguida a traves de frames consecutivos.
// La identidad reconocida es un cache; el id del track no depende de ella.
class IdentityTrack {
public:
    IdentityTrack(int id, const Detection& detection, std::unique_ptr<VisualTracker> tracker);

    IdentityTrack(IdentityTrack&&) = default;
    IdentityTrack& operator=(IdentityTrack&&) = default;

    // Nueva deteccion asociada: box + landmarks frescos, tracker reiniciado
    void refresh(const cv::Mat& frame, const Detection& det, int frame_index);

    // Frame de solo tracking. false = fallo (se incrementa el contador)
    bool update_tracker(const cv::Mat& frame);

    void set_recognition(const ClassificationResult& result) { recognition = result; }

    int id() const { return track_id; }
    const cv::Rect& box() const { return bbox; }
    const Detection& detection() const { return last_detection; }
    const std::optional<ClassificationResult>& cached_recognition() const { return recognition; }
    int tracking_failures() const { return failures; }
    int last_detected_frame() const { return detected_frame; }
    bool from_detection() const { return fresh; }

private:
    int track_id;
    cv::Rect bbox;
    Detection last_detection;
    std::unique_ptr<VisualTracker> tracker;
    std::optional<ClassificationResult> recognition;
    int failures;
    int detected_frame;
    bool fresh;             // box viene de la ultima deteccion, no del tracker
    bool tracker_ready;

    void init_tracker(const cv::Mat& frame);
};

}  // namespace quickroll
