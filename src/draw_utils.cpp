#include "quickroll/draw_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace quickroll {
namespace DrawUtils {

cv::Scalar status_color(RecognitionStatus status) {
    switch (status) {
        case RecognitionStatus::RECOGNIZED: return cv::Scalar(0, 255, 0);
        case RecognitionStatus::MAYBE:      return cv::Scalar(0, 165, 255);
        case RecognitionStatus::COOLDOWN:   return cv::Scalar(0, 255, 255);
        case RecognitionStatus::UNKNOWN:
        case RecognitionStatus::NO_FACE:    return cv::Scalar(0, 0, 255);
    }
    return cv::Scalar(0, 0, 255);
}

void draw_text_with_background(cv::Mat& frame, const std::string& text,
                               const cv::Point& position,
                               const cv::Scalar& text_color,
                               const cv::Scalar& bg_color,
                               const DrawConfig& config) {
    int baseline = 0;
    cv::Size text_size = cv::getTextSize(text, config.font, config.font_scale,
                                         config.thickness, &baseline);

    cv::rectangle(frame,
                  cv::Point(position.x - 2, position.y - text_size.height - 4),
                  cv::Point(position.x + text_size.width + 3, position.y + baseline + 2),
                  bg_color, -1);

    cv::putText(frame, text, position,
                config.font, config.font_scale, text_color, config.thickness);
}

void draw_fps_counter(cv::Mat& frame, double fps, const cv::Point& position,
                      const DrawConfig& config) {
    cv::putText(frame, fmt::format("FPS: {:.1f}", fps), position,
                config.font, 0.7, config.color, config.thickness);
}

void draw_face_box(cv::Mat& frame, const cv::Rect& box, const std::string& label,
                   float confidence, const cv::Scalar& color, bool fresh,
                   const DrawConfig& config) {
    cv::rectangle(frame, box, color, fresh ? 2 : 1);

    if (!label.empty()) {
        int y = std::max(box.y - 10, 20);
        draw_text_with_background(frame, label, cv::Point(box.x + 2, y),
                                  color, config.label_bg, config);
    }

    if (confidence > 0.0f) {
        int bar_width = static_cast<int>(box.width * std::min(confidence, 1.0f));
        int top = box.y + box.height + 5;
        cv::rectangle(frame, cv::Point(box.x, top), cv::Point(box.x + bar_width, top + 5), color, -1);
        cv::rectangle(frame, cv::Point(box.x, top), cv::Point(box.x + box.width, top + 5),
                      cv::Scalar(100, 100, 100), 1);
    }
}

void draw_detection(cv::Mat& frame, const Detection& detection) {
    const cv::Rect& box = detection.box;
    cv::rectangle(frame, box, cv::Scalar(0, 255, 0), 2);

    for (size_t i = 0; i < detection.landmarks.size(); i++) {
        cv::Scalar color = i < 2 ? cv::Scalar(0, 0, 255) : cv::Scalar(0, 255, 255);
        cv::circle(frame, detection.landmarks[i], 2, color, -1);
    }

    cv::putText(frame, fmt::format("{:.2f}", detection.confidence),
                cv::Point(box.x, box.y - 10),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 255, 0), 1);
}

void draw_progress_bar(cv::Mat& frame, float progress, const cv::Rect& area,
                       const cv::Scalar& color) {
    float p = std::max(0.0f, std::min(progress, 1.0f));
    cv::Rect filled(area.x, area.y, static_cast<int>(area.width * p), area.height);

    cv::rectangle(frame, area, cv::Scalar(60, 60, 60), -1);
    if (filled.width > 0) {
        cv::rectangle(frame, filled, color, -1);
    }
    cv::rectangle(frame, area, cv::Scalar(200, 200, 200), 1);
}

void draw_capture_flash(cv::Mat& frame, int thickness) {
    cv::rectangle(frame, cv::Point(0, 0), cv::Point(frame.cols, frame.rows),
                  cv::Scalar(255, 255, 255), thickness);
}

void draw_status_message(cv::Mat& frame, const std::string& message,
                         const cv::Scalar& color, const DrawConfig& config) {
    int baseline = 0;
    cv::Size size = cv::getTextSize(message, config.font, 0.8, config.thickness, &baseline);
    cv::Point pos((frame.cols - size.width) / 2, frame.rows - config.margin_y);

    DrawConfig big = config;
    big.font_scale = 0.8;
    draw_text_with_background(frame, message, pos, color, config.label_bg, big);
}

}
}  // namespace quickroll
