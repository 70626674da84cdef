#pragma once
#include "quickroll/core/types.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <string>

namespace quickroll {
namespace DrawUtils {

    struct DrawConfig {
        cv::Scalar color = cv::Scalar(0, 255, 255);
        cv::Scalar label_bg = cv::Scalar(0, 0, 0);
        int font = cv::FONT_HERSHEY_SIMPLEX;
        double font_scale = 0.6;
        int thickness = 2;
        int line_spacing = 25;
        int margin_x = 10;
        int margin_y = 30;
    };

    // BGR por estado: verde / naranja / rojo / amarillo
    cv::Scalar status_color(RecognitionStatus status);

    void draw_text_with_background(cv::Mat& frame, const std::string& text,
                                   const cv::Point& position,
                                   const cv::Scalar& text_color,
                                   const cv::Scalar& bg_color,
                                   const DrawConfig& config = DrawConfig());

    void draw_fps_counter(cv::Mat& frame, double fps,
                          const cv::Point& position,
                          const DrawConfig& config = DrawConfig());

    // Box + etiqueta + barra de confianza.
    // fresh = box de deteccion (trazo grueso) vs tracker (trazo fino)
    void draw_face_box(cv::Mat& frame, const cv::Rect& box, const std::string& label,
                       float confidence, const cv::Scalar& color, bool fresh,
                       const DrawConfig& config = DrawConfig());

    // Box verde, ojos en rojo, resto de landmarks en amarillo, score arriba
    void draw_detection(cv::Mat& frame, const Detection& detection);

    void draw_progress_bar(cv::Mat& frame, float progress, const cv::Rect& area,
                           const cv::Scalar& color = cv::Scalar(0, 255, 0));

    // Borde blanco en todo el frame al capturar
    void draw_capture_flash(cv::Mat& frame, int thickness = 10);

    // Mensaje centrado en la parte inferior
    void draw_status_message(cv::Mat& frame, const std::string& message,
                             const cv::Scalar& color,
                             const DrawConfig& config = DrawConfig());
}
}  // namespace quickroll
