#include "tracking/geometry.hpp"
#include <cmath>

float calculate_iou(const cv::Rect2f& a, const cv::Rect2f& b) {
    if (a.width <= 0 || a.height <= 0 || b.width <= 0 || b.height <= 0) {
        return 0.0f;
    }

    float intersection = (a & b).area();
    float union_area = a.area() + b.area() - intersection;

    if (union_area <= 0) return 0.0f;
    return intersection / union_area;
}

bool is_finite_box(const cv::Rect2f& box) {
    return std::isfinite(box.x) && std::isfinite(box.y) &&
           std::isfinite(box.width) && std::isfinite(box.height);
}

cv::Rect clip_box(const cv::Rect2f& box, const cv::Size& frame_size) {
    if (!is_finite_box(box)) {
        return cv::Rect();
    }

    cv::Rect rounded(
        static_cast<int>(std::floor(box.x)),
        static_cast<int>(std::floor(box.y)),
        static_cast<int>(std::ceil(box.width)),
        static_cast<int>(std::ceil(box.height))
    );

    return rounded & cv::Rect(0, 0, frame_size.width, frame_size.height);
}
