// ============= include/recognition/embedding_extractor.hpp =============
/*
 * Embedding Extractor - Interfaz del extractor externo
 *
 * CONTRATO:
 * - embed(frame, box) -> vector de dimensión fija por despliegue
 * - El recorte y la alineación son responsabilidad del extractor
 * - Puede lanzar; el pipeline lo trata como fallo transitorio
 */

#pragma once
#include <opencv2/opencv.hpp>
#include <vector>

class EmbeddingExtractor {
public:
    virtual ~EmbeddingExtractor() = default;

    virtual std::vector<float> embed(const cv::Mat& frame, const cv::Rect2f& box) = 0;

    virtual int get_embedding_size() const = 0;

    // Cosine similarity (0 si alguno tiene norma cero o las dimensiones difieren)
    static float compare(const std::vector<float>& emb1,
                         const std::vector<float>& emb2);

    // L2 normalize in place; retorna false si la norma es cero o no finita
    static bool l2_normalize(std::vector<float>& embedding);
};
