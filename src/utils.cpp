#include "quickroll/utils.hpp"
#include <spdlog/spdlog.h>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace quickroll {

namespace {

bool is_device_index(const std::string& source) {
    return !source.empty() &&
           std::all_of(source.begin(), source.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

std::tm to_local_tm(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    return local;
}

}  // namespace

// ==================== CAMERA ====================

cv::VideoCapture open_camera(const std::string& source, int retries) {
    cv::VideoCapture cap;

    spdlog::info("abriendo fuente de video: {}", source);

    for (int i = 0; i < retries; ++i) {
        spdlog::info("intento {}/{}...", i + 1, retries);

        if (is_device_index(source)) {
            cap.open(std::stoi(source), cv::CAP_ANY);
        } else {
            cap.open(source);
        }

        if (cap.isOpened()) {
            cv::Mat test_frame;
            int read_attempts = 0;
            bool can_read = false;

            // Dar tiempo para estabilizar
            while (read_attempts < 5 && !can_read) {
                can_read = cap.read(test_frame) && !test_frame.empty();
                if (!can_read) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(300));
                    read_attempts++;
                }
            }

            if (can_read) {
                double fps = cap.get(cv::CAP_PROP_FPS);
                spdlog::info("✓ fuente abierta");
                spdlog::info("  resolucion: {}x{}", test_frame.cols, test_frame.rows);
                spdlog::info("  fps reportado: {:.1f}", fps > 0 ? fps : 0.0);
                return cap;
            }

            spdlog::warn("fuente abierta pero no entrega frames (intentos: {})", read_attempts);
            cap.release();
        }

        if (i < retries - 1) {
            int wait_time = std::min(1 + i, 5);
            spdlog::warn("intento {}/{} fallido. reintentando en {}s...", i + 1, retries, wait_time);
            std::this_thread::sleep_for(std::chrono::seconds(wait_time));
        }
    }

    spdlog::error("✗ no se pudo abrir {} despues de {} intentos", source, retries);
    throw std::runtime_error("no se pudo abrir la fuente de video: " + source);
}

ReadStatus read_frame(cv::VideoCapture& cap, cv::Mat& frame, int& failures, int max_failures) {
    if (cap.read(frame) && !frame.empty()) {
        failures = 0;
        return ReadStatus::OK;
    }

    failures++;
    if (failures >= max_failures) {
        spdlog::warn("fuente sin frames ({} lecturas fallidas)", failures);
        return ReadStatus::END;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    return ReadStatus::RETRY;
}

// ==================== FPS ====================

double FpsCounter::update() {
    return update(std::chrono::steady_clock::now());
}

double FpsCounter::update(std::chrono::steady_clock::time_point now) {
    times.push_back(now);
    while (times.size() > window) {
        times.pop_front();
    }
    return current();
}

double FpsCounter::current() const {
    if (times.size() < 2) {
        return 0.0;
    }

    double elapsed = std::chrono::duration<double>(times.back() - times.front()).count();
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return (times.size() - 1) / elapsed;
}

// ==================== TIME ====================

std::string format_date(std::chrono::system_clock::time_point tp) {
    std::tm local = to_local_tm(tp);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d");
    return ss.str();
}

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::tm local = to_local_tm(tp);
    std::stringstream ss;
    ss << std::put_time(&local, "%H:%M:%S");
    return ss.str();
}

bool parse_local_datetime(const std::string& date, const std::string& time,
                          std::chrono::system_clock::time_point& out) {
    std::tm tm{};
    std::istringstream ss(date + " " + time);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        return false;
    }

    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }

    out = std::chrono::system_clock::from_time_t(t);
    return true;
}

}  // namespace quickroll
