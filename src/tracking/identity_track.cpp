#include "quickroll/tracking/identity_track.hpp"
#include <spdlog/spdlog.h>

namespace quickroll {

IdentityTrack::IdentityTrack(int id, const Detection& detection,
                             std::unique_ptr<VisualTracker> tracker)
    : track_id(id), bbox(detection.box), last_detection(detection),
      tracker(std::move(tracker)), failures(0), detected_frame(0),
      fresh(true), tracker_ready(false) {}

void IdentityTrack::init_tracker(const cv::Mat& frame) {
    tracker_ready = tracker && tracker->init(frame, bbox);
    if (!tracker_ready) {
        spdlog::debug("Track {}: no se pudo inicializar el tracker", track_id);
    }
}

void IdentityTrack::refresh(const cv::Mat& frame, const Detection& det, int frame_index) {
    bbox = det.box;
    last_detection = det;
    detected_frame = frame_index;
    failures = 0;
    fresh = true;
    init_tracker(frame);
}

bool IdentityTrack::update_tracker(const cv::Mat& frame) {
    fresh = false;

    cv::Rect found = bbox;
    if (!tracker_ready || !tracker->update(frame, found)) {
        failures++;
        return false;
    }

    bbox = found;
    failures = 0;
    return true;
}

}  // namespace quickroll
