#include "quickroll/tracking/visual_tracker.hpp"
#include <spdlog/spdlog.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace quickroll {

// ==================== TEMPLATE TRACKER ====================

TemplateTracker::TemplateTracker(float match_threshold)
    : match_threshold(match_threshold), score(0.0f) {}

bool TemplateTracker::init(const cv::Mat& frame, const cv::Rect& box) {
    templ.release();
    bbox = box & cv::Rect(0, 0, frame.cols, frame.rows);

    if (frame.empty() || bbox.width <= 0 || bbox.height <= 0) {
        return false;
    }

    templ = frame(bbox).clone();
    return true;
}

bool TemplateTracker::update(const cv::Mat& frame, cv::Rect& box) {
    box = bbox;
    if (templ.empty() || frame.empty() || frame.type() != templ.type()) {
        return false;
    }

    // Ventana de busqueda: 2x la cara, centrada en el ultimo box
    int margin_w = bbox.width / 2;
    int margin_h = bbox.height / 2;

    int search_x = std::max(0, bbox.x - margin_w);
    int search_y = std::max(0, bbox.y - margin_h);
    int search_w = std::min(frame.cols - search_x, bbox.width + 2 * margin_w);
    int search_h = std::min(frame.rows - search_y, bbox.height + 2 * margin_h);

    if (search_w < templ.cols || search_h < templ.rows) {
        return false;
    }

    cv::Mat search_area = frame(cv::Rect(search_x, search_y, search_w, search_h));

    cv::Mat response;
    double max_val = 0.0;
    cv::Point max_loc;
    try {
        cv::matchTemplate(search_area, templ, response, cv::TM_CCOEFF_NORMED);
        cv::minMaxLoc(response, nullptr, &max_val, nullptr, &max_loc);
    } catch (const cv::Exception& e) {
        spdlog::debug("matchTemplate fallo: {}", e.what());
        return false;
    }

    score = static_cast<float>(max_val);
    if (score <= match_threshold) {
        return false;
    }

    bbox = cv::Rect(search_x + max_loc.x, search_y + max_loc.y, templ.cols, templ.rows);
    box = bbox;
    return true;
}

// ==================== OPENCV TRACKER ====================

OpenCvTracker::OpenCvTracker(cv::Ptr<cv::Tracker> tracker)
    : tracker(std::move(tracker)), initialized(false) {}

bool OpenCvTracker::init(const cv::Mat& frame, const cv::Rect& box) {
    initialized = false;
    cv::Rect clipped = box & cv::Rect(0, 0, frame.cols, frame.rows);
    if (!tracker || frame.empty() || clipped.area() <= 0) {
        return false;
    }

    try {
        tracker->init(frame, clipped);
    } catch (const cv::Exception& e) {
        spdlog::debug("Tracker init fallo: {}", e.what());
        return false;
    }

    initialized = true;
    return true;
}

bool OpenCvTracker::update(const cv::Mat& frame, cv::Rect& box) {
    if (!initialized || frame.empty()) {
        return false;
    }

    cv::Rect found = box;
    try {
        if (!tracker->update(frame, found)) {
            return false;
        }
    } catch (const cv::Exception& e) {
        spdlog::debug("Tracker update fallo: {}", e.what());
        return false;
    }

    box = found;
    return true;
}

// ==================== FACTORY ====================

TrackerBackend parse_tracker_backend(const std::string& name) {
    if (name == "native" || name == "mil") return TrackerBackend::NATIVE;
    if (name == "template") return TrackerBackend::TEMPLATE;
    if (name != "auto" && !name.empty()) {
        spdlog::warn("Tracker backend '{}' desconocido, usando auto", name);
    }
    return TrackerBackend::AUTO;
}

namespace {

bool native_tracker_available() {
    try {
        cv::Ptr<cv::Tracker> probe = cv::TrackerMIL::create();
        return !probe.empty();
    } catch (const cv::Exception& e) {
        spdlog::warn("TrackerMIL no disponible: {}", e.what());
        return false;
    }
}

}  // namespace

TrackerFactory make_tracker_factory(TrackerBackend backend) {
    bool use_native = false;

    switch (backend) {
        case TrackerBackend::TEMPLATE:
            use_native = false;
            break;
        case TrackerBackend::NATIVE:
        case TrackerBackend::AUTO:
            use_native = native_tracker_available();
            if (!use_native && backend == TrackerBackend::NATIVE) {
                spdlog::warn("Tracker nativo pedido pero no disponible, fallback a template");
            }
            break;
    }

    if (use_native) {
        spdlog::info("Visual tracker: MIL (OpenCV)");
        return []() -> std::unique_ptr<VisualTracker> {
            return std::make_unique<OpenCvTracker>(cv::TrackerMIL::create());
        };
    }

    spdlog::info("Visual tracker: template matching (NCC > {:.2f})",
                 Config::TEMPLATE_MATCH_THRESHOLD);
    return []() -> std::unique_ptr<VisualTracker> {
        return std::make_unique<TemplateTracker>();
    };
}

}  // namespace quickroll
