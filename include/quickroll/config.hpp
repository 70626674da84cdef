#pragma once

namespace quickroll {
namespace Config {

    // Umbrales de confianza (reconocimiento y asistencia usan los mismos valores)
    constexpr float HIGH_CONFIDENCE = 0.75f;   // RECOGNIZED / auto-mark
    constexpr float LOW_CONFIDENCE = 0.50f;    // MAYBE
    constexpr float MIN_CONFIDENCE = 0.40f;    // piso para top-N

    // Frame tracker
    constexpr int DETECTION_INTERVAL = 5;
    constexpr int RECOGNITION_INTERVAL = 15;
    constexpr int MAX_TRACKING_FAILURES = 3;
    constexpr float IOU_THRESHOLD = 0.3f;
    constexpr int RECOGNITION_CROP_PADDING = 10;
    constexpr float TEMPLATE_MATCH_THRESHOLD = 0.4f;
    constexpr int FPS_WINDOW = 30;

    // Asistencia
    constexpr int COOLDOWN_SECONDS = 900;      // 15 min
    constexpr const char* DEFAULT_SOURCE = "face_recognition";

    // Captura guiada
    constexpr int MIN_FACE_SIZE = 60;
    constexpr double BLUR_THRESHOLD = 100.0;
    constexpr double DARK_THRESHOLD = 40.0;
    constexpr double BRIGHT_THRESHOLD = 220.0;
    constexpr float FRONT_YAW_LIMIT = 0.2f;
    constexpr float TURN_YAW_LIMIT = 0.4f;
    constexpr double CAPTURE_INTERVAL_SEC = 1.0;
    constexpr float CAPTURE_PADDING = 0.2f;

    // Modelos (OpenCV Zoo)
    constexpr const char* DEFAULT_DETECTOR_MODEL = "models/face_detection_yunet_2023mar.onnx";
    constexpr const char* DEFAULT_RECOGNIZER_MODEL = "models/face_recognition_sface_2021dec.onnx";
    constexpr float DETECTOR_SCORE_THRESHOLD = 0.8f;
    constexpr float DETECTOR_NMS_THRESHOLD = 0.3f;
    constexpr int DETECTOR_TOP_K = 5000;
    constexpr int EMBEDDING_INPUT_SIZE = 112;

    // Persistencia
    constexpr const char* DEFAULT_DB_PATH = "data/quickroll.db";
    constexpr const char* DEFAULT_IMAGE_ROOT = "data/students";

    // Display
    constexpr int DEFAULT_CAMERA_INDEX = 0;
    constexpr int MAX_READ_FAILURES = 30;      // lecturas fallidas seguidas -> fin del stream
    constexpr int DEFAULT_DISPLAY_WIDTH = 1280;
    constexpr int DEFAULT_DISPLAY_HEIGHT = 720;
}
}  // namespace quickroll
