#pragma once
#include "quickroll/config.hpp"
#include <opencv2/videoio.hpp>
#include <chrono>
#include <deque>
#include <string>

namespace quickroll {

// Abrir camara con reintentos
// - source numerico ("0", "1"): indice de dispositivo
// - cualquier otra cosa: URL / archivo (rtsp://, http://, .mp4)
cv::VideoCapture open_camera(const std::string& source, int retries = 5);

enum class ReadStatus {
    OK,
    RETRY,      // lectura fallida, seguir intentando
    END         // fin de archivo o camara perdida
};

// Lee un frame; `failures` cuenta lecturas fallidas seguidas y vuelve a 0
// con cada frame valido. END al llegar a max_failures.
ReadStatus read_frame(cv::VideoCapture& cap, cv::Mat& frame, int& failures,
                      int max_failures = Config::MAX_READ_FAILURES);

// FPS con promedio movil sobre los ultimos N frames
class FpsCounter {
public:
    explicit FpsCounter(size_t window = 30) : window(window) {}

    double update();
    double update(std::chrono::steady_clock::time_point now);
    double current() const;
    void reset() { times.clear(); }

private:
    size_t window;
    std::deque<std::chrono::steady_clock::time_point> times;
};

// Fecha / hora local en el formato del log de asistencia
std::string format_date(std::chrono::system_clock::time_point tp);   // YYYY-MM-DD
std::string format_time(std::chrono::system_clock::time_point tp);   // HH:MM:SS

// "YYYY-MM-DD" + "HH:MM:SS" -> time_point local; false si no parsea
bool parse_local_datetime(const std::string& date, const std::string& time,
                          std::chrono::system_clock::time_point& out);

}  // namespace quickroll
