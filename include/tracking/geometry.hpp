#pragma once
#include <opencv2/opencv.hpp>

// IoU entre dos cajas, 0 si alguna es degenerada
float calculate_iou(const cv::Rect2f& a, const cv::Rect2f& b);

bool is_finite_box(const cv::Rect2f& box);

// Caja recortada a los límites del frame (puede quedar vacía)
cv::Rect clip_box(const cv::Rect2f& box, const cv::Size& frame_size);
