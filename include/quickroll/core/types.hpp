// ============= include/quickroll/core/types.hpp =============
/*
 * Tipos compartidos del core QuickRoll
 *
 * - Detection: salida del detector (box + 5 landmarks + score)
 * - Embedding: vector de features del modelo de reconocimiento
 * - RecognitionStatus: estado cerrado que consumen tracker, engine y UI
 *
 * Orden de landmarks (YuNet):
 *   0 = ojo derecho, 1 = ojo izquierdo, 2 = nariz,
 *   3 = comisura derecha, 4 = comisura izquierda
 */

#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <vector>

namespace quickroll {

using Embedding = std::vector<float>;

enum LandmarkIndex {
    LANDMARK_RIGHT_EYE = 0,
    LANDMARK_LEFT_EYE = 1,
    LANDMARK_NOSE = 2,
    LANDMARK_RIGHT_MOUTH = 3,
    LANDMARK_LEFT_MOUTH = 4
};

struct Detection {
    cv::Rect box;
    std::array<cv::Point2f, 5> landmarks;
    float confidence = 0.0f;
};

enum class RecognitionStatus {
    RECOGNIZED,
    MAYBE,
    UNKNOWN,
    COOLDOWN,
    NO_FACE
};

const char* to_string(RecognitionStatus status);

struct EnrolledIdentity {
    std::string id;
    std::string name;
    std::vector<Embedding> references;   // una por pose capturada
};

struct AttendanceRecord {
    std::string identity;
    std::string name;
    std::string date;        // YYYY-MM-DD
    std::string time;        // HH:MM:SS
    std::string status = "Present";
    float confidence = 0.0f;
    std::string source = "face_recognition";
};

}  // namespace quickroll
