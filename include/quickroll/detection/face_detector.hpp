// ============= include/quickroll/detection/face_detector.hpp =============
/*
 * Face Detector - YuNet (OpenCV objdetect)
 *
 * CARACTERISTICAS:
 * - Interfaz abstracta FaceDetector: el core solo ve detect()
 * - YuNetDetector usa cv::FaceDetectorYN (ONNX, CPU)
 * - Input size se ajusta al tamano de cada frame
 *
 * OUTPUT:
 * - box (x, y, w, h), 5 landmarks, score
 *
 * ERRORES:
 * - Si el modelo no carga se loguea una vez en el constructor
 *   y detect() devuelve lista vacia
 * - Error de inferencia en detect(): std::runtime_error (lista vacia
 *   significa solo "no hay caras")
 */

#pragma once
#include "quickroll/core/types.hpp"
#include "quickroll/config.hpp"
#include <opencv2/objdetect.hpp>
#include <memory>
#include <string>
#include <vector>

namespace quickroll {

class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    virtual std::vector<Detection> detect(const cv::Mat& image) = 0;
};

class YuNetDetector : public FaceDetector {
public:
    struct Params {
        std::string model_path = Config::DEFAULT_DETECTOR_MODEL;
        float score_threshold = Config::DETECTOR_SCORE_THRESHOLD;
        float nms_threshold = Config::DETECTOR_NMS_THRESHOLD;
        int top_k = Config::DETECTOR_TOP_K;
    };

    explicit YuNetDetector(const Params& params);

    std::vector<Detection> detect(const cv::Mat& image) override;

    bool is_loaded() const { return !detector.empty(); }

    // Fila 1x15 en el formato que espera FaceRecognizerSF::alignCrop
    static cv::Mat to_face_row(const Detection& det);

private:
    Params params;
    cv::Ptr<cv::FaceDetectorYN> detector;
    cv::Size input_size;
};

}  // namespace quickroll
