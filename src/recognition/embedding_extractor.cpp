// ============= src/recognition/embedding_extractor.cpp =============
#include "recognition/embedding_extractor.hpp"
#include <cmath>

float EmbeddingExtractor::compare(const std::vector<float>& emb1,
                                  const std::vector<float>& emb2)
{
    if (emb1.empty() || emb1.size() != emb2.size()) {
        return 0.0f;
    }

    double dot = 0.0, norm1 = 0.0, norm2 = 0.0;
    for (size_t i = 0; i < emb1.size(); i++) {
        dot += static_cast<double>(emb1[i]) * emb2[i];
        norm1 += static_cast<double>(emb1[i]) * emb1[i];
        norm2 += static_cast<double>(emb2[i]) * emb2[i];
    }

    if (norm1 <= 0.0 || norm2 <= 0.0) {
        return 0.0f;
    }

    return static_cast<float>(dot / (std::sqrt(norm1) * std::sqrt(norm2)));
}

bool EmbeddingExtractor::l2_normalize(std::vector<float>& embedding) {
    double norm = 0.0;
    for (float v : embedding) {
        norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);

    if (!(norm > 1e-12) || !std::isfinite(norm)) {
        return false;
    }

    for (float& v : embedding) {
        v = static_cast<float>(v / norm);
    }
    return true;
}
