#include "quickroll/capture/face_validator.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace quickroll {
namespace FaceValidator {

QualityReport check_quality(const cv::Mat& frame, const cv::Rect& box,
                            const QualityConfig& config) {
    QualityReport report;

    if (box.width < config.min_face_size || box.height < config.min_face_size) {
        report.issues.push_back(fmt::format("Too Small ({}x{})", box.width, box.height));
    }

    cv::Rect roi = box & cv::Rect(0, 0, frame.cols, frame.rows);
    if (frame.empty() || roi.area() <= 0) {
        report.passed = false;
        report.issues = {"Invalid ROI"};
        return report;
    }

    cv::Mat face = frame(roi);
    cv::Mat gray;
    if (face.channels() == 3) {
        cv::cvtColor(face, gray, cv::COLOR_BGR2GRAY);
    } else if (face.channels() == 4) {
        cv::cvtColor(face, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = face;
    }

    // Nitidez
    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);
    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);
    report.sharpness = stddev[0] * stddev[0];

    if (report.sharpness < config.blur_threshold) {
        report.issues.push_back("Blurry");
    }

    // Iluminacion
    report.brightness = cv::mean(gray)[0];
    if (report.brightness < config.dark_threshold) {
        report.issues.push_back("Too Dark");
    } else if (report.brightness > config.bright_threshold) {
        report.issues.push_back("Too Bright");
    }

    report.passed = report.issues.empty();

    spdlog::debug("Calidad {}x{}: sharpness={:.1f} brightness={:.1f} -> {}",
                  box.width, box.height, report.sharpness, report.brightness,
                  report.passed ? "OK" : join_issues(report.issues));

    return report;
}

float estimate_yaw(const Detection& detection) {
    const cv::Point2f& right_eye = detection.landmarks[LANDMARK_RIGHT_EYE];
    const cv::Point2f& left_eye = detection.landmarks[LANDMARK_LEFT_EYE];
    const cv::Point2f& nose = detection.landmarks[LANDMARK_NOSE];

    float d_re = std::abs(nose.x - right_eye.x);
    float d_le = std::abs(left_eye.x - nose.x);

    float span = d_re + d_le;
    if (span <= 0.0f) return 0.0f;

    return (d_le - d_re) / span;
}

std::string join_issues(const std::vector<std::string>& issues) {
    std::string out;
    for (size_t i = 0; i < issues.size(); i++) {
        if (i > 0) out += ", ";
        out += issues[i];
    }
    return out;
}

}  // namespace FaceValidator
}  // namespace quickroll
