// ============= src/draw_utils.cpp =============
#include "draw_utils.hpp"
#include "pipeline/face_pipeline.hpp"
#include "tracking/geometry.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace DrawUtils {

void draw_tracks(cv::Mat& frame, const FrameResult& result, const DrawConfig& config) {
    for (const auto& track : result.tracks) {
        cv::Rect box = clip_box(track.box, frame.size());
        if (box.empty()) continue;

        bool known = track.identity && track.identity->person_id;
        cv::Scalar color = known ? config.known_color : config.unknown_color;
        cv::rectangle(frame, box, color, 2);

        std::string label = "ID " + std::to_string(track.track_id);
        if (config.show_identity && track.identity) {
            if (track.identity->person_id) {
                label += fmt::format(" | {} ({:.2f})", *track.identity->person_id,
                                     track.identity->score);
            } else {
                label += " | unknown";
            }
        }
        if (config.show_engagement) {
            label += std::string(" | ") + to_string(track.engagement);
        }

        cv::Point origin(box.x, std::max(box.y - 5, config.margin_y));
        draw_text_with_background(frame, label, origin, config.text_color, color, config);
    }
}

void draw_timings(cv::Mat& frame, const FrameResult& result, const DrawConfig& config) {
    if (!config.show_timings) return;

    const auto& t = result.timings;
    const std::string lines[] = {
        fmt::format("frame: {}", result.frame_index),
        fmt::format("detect: {:.1f}ms", t.detect_ms),
        fmt::format("track: {:.1f}ms", t.predict_ms + t.associate_ms + t.lifecycle_ms),
        fmt::format("identify: {:.1f}ms", t.identify_ms),
        fmt::format("behavior: {:.1f}ms", t.behavior_ms),
        fmt::format("total: {:.1f}ms", t.total_ms),
    };

    int y = config.margin_y;
    for (const auto& line : lines) {
        draw_text_with_background(frame, line, cv::Point(config.margin_x, y),
                                  config.text_color, config.bg_color, config);
        y += config.line_spacing;
    }
}

void draw_text_with_background(cv::Mat& frame, const std::string& text,
                               const cv::Point& position,
                               const cv::Scalar& text_color,
                               const cv::Scalar& bg_color,
                               const DrawConfig& config) {
    int baseline = 0;
    cv::Size text_size = cv::getTextSize(text, config.font, config.font_scale,
                                         config.thickness, &baseline);

    // Draw background rectangle
    cv::rectangle(frame,
                 cv::Point(position.x - 2, position.y - text_size.height - 2),
                 cv::Point(position.x + text_size.width + 2, position.y + baseline + 2),
                 bg_color, -1);

    // Draw text
    cv::putText(frame, text, position,
               config.font, config.font_scale, text_color, config.thickness);
}

}
