// ============= include/quickroll/capture/face_validator.hpp =============
/*
 * Face Validator - calidad de imagen + yaw por landmarks
 *
 * CALIDAD (check_quality):
 * - Tamano minimo 60x60           -> "Too Small (wxh)"
 * - Varianza del Laplaciano < 100 -> "Blurry"
 * - Brillo medio < 40 / > 220     -> "Too Dark" / "Too Bright"
 * - ROI vacio                     -> "Invalid ROI"
 *
 * YAW (estimate_yaw):
 *   d_re = |nose.x - right_eye.x|, d_le = |left_eye.x - nose.x|
 *   yaw  = (d_le - d_re) / (d_le + d_re)    en [-1, 1], 0 = frontal
 *   Positivo = giro a la izquierda (frame sin espejo)
 */

#pragma once
#include "quickroll/core/types.hpp"
#include "quickroll/config.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace quickroll {

struct QualityConfig {
    int min_face_size = Config::MIN_FACE_SIZE;
    double blur_threshold = Config::BLUR_THRESHOLD;
    double dark_threshold = Config::DARK_THRESHOLD;
    double bright_threshold = Config::BRIGHT_THRESHOLD;
};

struct QualityReport {
    bool passed = false;
    std::vector<std::string> issues;
    double sharpness = 0.0;      // varianza del Laplaciano
    double brightness = 0.0;     // media en gris
};

namespace FaceValidator {

    QualityReport check_quality(const cv::Mat& frame, const cv::Rect& box,
                                const QualityConfig& config = QualityConfig());

    float estimate_yaw(const Detection& detection);

    // "Blurry, Too Dark"
    std::string join_issues(const std::vector<std::string>& issues);

}  // namespace FaceValidator

}  // namespace quickroll
