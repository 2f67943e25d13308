// ============= src/recognition/sface_embedder.cpp =============
#include "recognition/sface_embedder.hpp"
#include "tracking/geometry.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

SFaceEmbedder::SFaceEmbedder(const std::string& model_path) {
    spdlog::info("📦 Loading SFace recognizer: {}", model_path);

    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("Recognizer model not found: " + model_path);
    }

    model = cv::FaceRecognizerSF::create(model_path, "");
    if (model.empty()) {
        throw std::runtime_error("Could not load recognizer model: " + model_path);
    }

    spdlog::info("   Embedding size: {}", embedding_size);
}

std::vector<float> SFaceEmbedder::embed(const cv::Mat& frame, const cv::Rect2f& box) {
    cv::Rect roi = clip_box(box, frame.size());
    if (roi.empty()) {
        throw std::runtime_error("Empty face crop");
    }

    cv::Mat face;
    cv::resize(frame(roi), face, cv::Size(input_size, input_size));

    cv::Mat feature;
    model->feature(face, feature);

    if (feature.total() != static_cast<size_t>(embedding_size)) {
        throw std::runtime_error("Unexpected embedding size: " + std::to_string(feature.total()));
    }

    cv::Mat flat = feature.reshape(1, 1);
    if (flat.type() != CV_32F) {
        flat.convertTo(flat, CV_32F);
    }
    return std::vector<float>(flat.ptr<float>(0), flat.ptr<float>(0) + embedding_size);
}
