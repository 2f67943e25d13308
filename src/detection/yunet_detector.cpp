// ============= src/detection/yunet_detector.cpp =============
#include "detection/yunet_detector.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

YuNetDetector::YuNetDetector(const std::string& model_path,
                             float conf_threshold,
                             float nms_threshold,
                             int min_face_size)
    : conf_threshold(conf_threshold),
      nms_threshold(nms_threshold),
      min_face_size(min_face_size)
{
    spdlog::info("📦 Loading YuNet detector: {}", model_path);

    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("Detector model not found: " + model_path);
    }

    model = cv::FaceDetectorYN::create(model_path, "", cv::Size(320, 320),
                                       conf_threshold, nms_threshold, 5000);
    if (model.empty()) {
        throw std::runtime_error("Could not load detector model: " + model_path);
    }

    spdlog::info("   Conf threshold: {:.2f}", conf_threshold);
    spdlog::info("   Min face size: {}px", min_face_size);
}

void YuNetDetector::set_conf_threshold(float threshold) {
    conf_threshold = threshold;
    model->setScoreThreshold(threshold);
}

cv::Mat YuNetDetector::run(const cv::Mat& image) {
    cv::Mat faces;
    if (image.empty()) return faces;

    model->setInputSize(image.size());
    model->detect(image, faces);
    return faces;
}

std::vector<Detection> YuNetDetector::detect(const cv::Mat& frame) {
    std::vector<Detection> detections;

    cv::Mat faces = run(frame);
    for (int i = 0; i < faces.rows; i++) {
        float x = faces.at<float>(i, 0);
        float y = faces.at<float>(i, 1);
        float w = faces.at<float>(i, 2);
        float h = faces.at<float>(i, 3);
        float score = faces.at<float>(i, 14);

        if (w <= 0 || h <= 0) continue;

        bool quality_ok = w >= min_face_size && h >= min_face_size;
        detections.emplace_back(cv::Rect2f(x, y, w, h), score, quality_ok);
    }

    return detections;
}

std::vector<FaceLandmarks> YuNetDetector::detect_landmarks(const cv::Mat& image) {
    std::vector<FaceLandmarks> result;

    cv::Mat faces = run(image);
    for (int i = 0; i < faces.rows; i++) {
        FaceLandmarks lm;
        for (int k = 0; k < 5; k++) {
            lm.points[k] = cv::Point2f(faces.at<float>(i, 4 + 2 * k),
                                       faces.at<float>(i, 5 + 2 * k));
        }
        lm.score = faces.at<float>(i, 14);
        result.push_back(lm);
    }

    return result;
}
