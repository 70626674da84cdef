#include "quickroll/detection/face_detector.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace quickroll {

YuNetDetector::YuNetDetector(const Params& params)
    : params(params), input_size(320, 320)
{
    spdlog::info("Inicializando YuNet Face Detector");
    spdlog::info("   Model: {}", params.model_path);
    spdlog::info("   Score threshold: {:.2f}, NMS: {:.2f}",
                 params.score_threshold, params.nms_threshold);

    try {
        detector = cv::FaceDetectorYN::create(params.model_path, "", input_size,
                                              params.score_threshold,
                                              params.nms_threshold,
                                              params.top_k);
    } catch (const cv::Exception& e) {
        spdlog::error("No se pudo cargar YuNet ({}): {}", params.model_path, e.what());
        detector.release();
        return;
    }

    spdlog::info("✓ YuNet ready");
}

std::vector<Detection> YuNetDetector::detect(const cv::Mat& image) {
    std::vector<Detection> detections;
    if (detector.empty() || image.empty()) {
        return detections;
    }

    if (image.size() != input_size) {
        input_size = image.size();
        detector->setInputSize(input_size);
    }

    cv::Mat faces;
    try {
        detector->detect(image, faces);
    } catch (const cv::Exception& e) {
        // "Sin caras" y "detector roto" no son lo mismo para el tracker
        spdlog::warn("YuNet detect fallo: {}", e.what());
        throw std::runtime_error(std::string("YuNet detect: ") + e.what());
    }

    // Cada fila: x, y, w, h, 5x(lx, ly), score
    for (int i = 0; i < faces.rows; i++) {
        const float* row = faces.ptr<float>(i);

        Detection det;
        det.box = cv::Rect(cvRound(row[0]), cvRound(row[1]),
                           cvRound(row[2]), cvRound(row[3]));
        for (int k = 0; k < 5; k++) {
            det.landmarks[k] = cv::Point2f(row[4 + 2 * k], row[5 + 2 * k]);
        }
        det.confidence = row[14];
        detections.push_back(det);
    }

    return detections;
}

cv::Mat YuNetDetector::to_face_row(const Detection& det) {
    cv::Mat row(1, 15, CV_32F);
    float* p = row.ptr<float>(0);
    p[0] = static_cast<float>(det.box.x);
    p[1] = static_cast<float>(det.box.y);
    p[2] = static_cast<float>(det.box.width);
    p[3] = static_cast<float>(det.box.height);
    for (int k = 0; k < 5; k++) {
        p[4 + 2 * k] = det.landmarks[k].x;
        p[5 + 2 * k] = det.landmarks[k].y;
    }
    p[14] = det.confidence;
    return row;
}

}  // namespace quickroll
