// ============= include/quickroll/tracking/visual_tracker.hpp =============
/*
 * Visual Trackers - seguimiento barato entre detecciones
 *
 * IMPLEMENTACIONES:
 * - OpenCvTracker: cv::TrackerMIL (modulo video de OpenCV)
 * - TemplateTracker: template matching con correlacion normalizada
 *   (TM_CCOEFF_NORMED) en una ventana 2x el tamano de la cara
 *
 * SELECCION:
 * - make_tracker_factory() prueba una vez el tracker nativo y devuelve
 *   la fabrica que usara el FrameTracker; no hay ramas en los call sites
 */

#pragma once
#include "quickroll/config.hpp"
#include <opencv2/core.hpp>
#include <opencv2/video/tracking.hpp>
#include <functional>
#include <memory>
#include <string>

namespace quickroll {

class VisualTracker {
public:
    virtual ~VisualTracker() = default;

    virtual bool init(const cv::Mat& frame, const cv::Rect& box) = 0;
    // true + box actualizado si encontro la cara en este frame
    virtual bool update(const cv::Mat& frame, cv::Rect& box) = 0;
};

class TemplateTracker : public VisualTracker {
public:
    explicit TemplateTracker(float match_threshold = Config::TEMPLATE_MATCH_THRESHOLD);

    bool init(const cv::Mat& frame, const cv::Rect& box) override;
    bool update(const cv::Mat& frame, cv::Rect& box) override;

    float last_score() const { return score; }

private:
    cv::Mat templ;
    cv::Rect bbox;
    float match_threshold;
    float score;
};

class OpenCvTracker : public VisualTracker {
public:
    explicit OpenCvTracker(cv::Ptr<cv::Tracker> tracker);

    bool init(const cv::Mat& frame, const cv::Rect& box) override;
    bool update(const cv::Mat& frame, cv::Rect& box) override;

private:
    cv::Ptr<cv::Tracker> tracker;
    bool initialized;
};

enum class TrackerBackend {
    AUTO,       // nativo si esta disponible, si no template
    NATIVE,
    TEMPLATE
};

TrackerBackend parse_tracker_backend(const std::string& name);

using TrackerFactory = std::function<std::unique_ptr<VisualTracker>()>;

TrackerFactory make_tracker_factory(TrackerBackend backend = TrackerBackend::AUTO);

}  // namespace quickroll
