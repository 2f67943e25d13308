// ============= include/recognition/sface_embedder.hpp =============
/*
 * SFace Embedder - OpenCV objdetect
 *
 * INPUT:
 * - Frame completo + caja del rostro
 * - El recorte se redimensiona a 112x112
 *
 * OUTPUT:
 * - Vector de 128 floats (sin normalizar; el índice normaliza)
 */

#pragma once
#include "recognition/embedding_extractor.hpp"
#include <opencv2/objdetect.hpp>
#include <string>

class SFaceEmbedder : public EmbeddingExtractor {
public:
    explicit SFaceEmbedder(const std::string& model_path);

    std::vector<float> embed(const cv::Mat& frame, const cv::Rect2f& box) override;

    int get_embedding_size() const override { return embedding_size; }

private:
    cv::Ptr<cv::FaceRecognizerSF> model;

    int input_size = 112;
    int embedding_size = 128;
};
