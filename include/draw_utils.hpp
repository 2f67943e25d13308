// ============= include/draw_utils.hpp =============
#pragma once
#include <opencv2/opencv.hpp>
#include <string>

struct FrameResult;

namespace DrawUtils {

    struct DrawConfig {
        bool show_identity = true;
        bool show_engagement = true;
        bool show_timings = true;

        cv::Scalar known_color = cv::Scalar(0, 255, 0);
        cv::Scalar unknown_color = cv::Scalar(0, 165, 255);
        cv::Scalar text_color = cv::Scalar(255, 255, 255);
        cv::Scalar bg_color = cv::Scalar(0, 0, 0);
        int font = cv::FONT_HERSHEY_SIMPLEX;
        double font_scale = 0.5;
        int thickness = 1;
        int line_spacing = 20;
        int margin_x = 10;
        int margin_y = 20;
    };

    // Cajas + "ID n | person (score) | engagement" por track
    void draw_tracks(cv::Mat& frame, const FrameResult& result,
                     const DrawConfig& config = DrawConfig());

    // Panel con tiempos por etapa
    void draw_timings(cv::Mat& frame, const FrameResult& result,
                      const DrawConfig& config = DrawConfig());

    void draw_text_with_background(cv::Mat& frame, const std::string& text,
                                   const cv::Point& position,
                                   const cv::Scalar& text_color,
                                   const cv::Scalar& bg_color,
                                   const DrawConfig& config = DrawConfig());
}
