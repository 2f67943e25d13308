// ============= src/database/vector_index.cpp =============
#include "database/vector_index.hpp"
#include "recognition/embedding_extractor.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

struct PreparedReference {
    int person_index;
    std::vector<float> vector;
};

// Normaliza y filtra referencias; conserva el orden de carga
std::vector<PreparedReference> prepare_references(const std::vector<IdentityRecord>& records,
                                                  int dim,
                                                  std::vector<std::string>& person_ids)
{
    std::vector<PreparedReference> prepared;
    person_ids.clear();

    for (const auto& record : records) {
        int person_index = -1;

        for (const auto& ref : record.references) {
            if (ref.size() != static_cast<size_t>(dim)) {
                spdlog::warn("⚠️  Skipping reference of '{}': dim {} (expected {})",
                             record.person_id, ref.size(), dim);
                continue;
            }

            std::vector<float> normalized = ref;
            if (!EmbeddingExtractor::l2_normalize(normalized)) {
                spdlog::warn("⚠️  Skipping zero-norm reference of '{}'", record.person_id);
                continue;
            }

            if (person_index < 0) {
                person_index = static_cast<int>(person_ids.size());
                person_ids.push_back(record.person_id);
            }
            prepared.push_back({person_index, std::move(normalized)});
        }
    }

    return prepared;
}

}  // namespace

const char* to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::BruteForce: return "brute_force";
        case BackendKind::Matrix:     return "matrix";
    }
    return "unknown";
}

BackendKind backend_from_string(const std::string& name) {
    if (name == "brute_force") return BackendKind::BruteForce;
    if (name == "matrix") return BackendKind::Matrix;
    throw std::invalid_argument("Unknown search backend: " + name);
}

// ==================== BRUTE FORCE ====================

BruteForceBackend::BruteForceBackend(const std::vector<IdentityRecord>& records, int dim)
    : dim(dim)
{
    for (auto& ref : prepare_references(records, dim, person_ids)) {
        references.emplace_back(ref.person_index, std::move(ref.vector));
    }
}

std::optional<SearchResult> BruteForceBackend::best(const std::vector<float>& normalized_query) const {
    if (references.empty() || normalized_query.size() != static_cast<size_t>(dim)) {
        return std::nullopt;
    }

    int best_person = -1;
    float best_similarity = 0.0f;

    for (const auto& [person_index, vec] : references) {
        float dot = 0.0f;
        for (int i = 0; i < dim; i++) {
            dot += normalized_query[i] * vec[i];
        }

        if (best_person < 0 || dot > best_similarity) {
            best_similarity = dot;
            best_person = person_index;
        }
    }

    return SearchResult{person_ids[best_person], best_similarity};
}

// ==================== MATRIX ====================

MatrixBackend::MatrixBackend(const std::vector<IdentityRecord>& records, int dim)
    : dim(dim)
{
    auto prepared = prepare_references(records, dim, person_ids);

    matrix = cv::Mat(static_cast<int>(prepared.size()), dim, CV_32F);
    owners.reserve(prepared.size());

    for (size_t i = 0; i < prepared.size(); i++) {
        cv::Mat row(1, dim, CV_32F, prepared[i].vector.data());
        row.copyTo(matrix.row(static_cast<int>(i)));
        owners.push_back(prepared[i].person_index);
    }
}

std::optional<SearchResult> MatrixBackend::best(const std::vector<float>& normalized_query) const {
    if (matrix.empty() || normalized_query.size() != static_cast<size_t>(dim)) {
        return std::nullopt;
    }

    // cv::Mat sobre el buffer de la query, sin copia
    cv::Mat query(1, dim, CV_32F, const_cast<float*>(normalized_query.data()));

    // scores = matrix * query^T  -> N x 1
    cv::Mat scores;
    cv::gemm(matrix, query, 1.0, cv::noArray(), 0.0, scores, cv::GEMM_2_T);

    int best_row = 0;
    float best_similarity = scores.at<float>(0, 0);
    for (int r = 1; r < scores.rows; r++) {
        float s = scores.at<float>(r, 0);
        if (s > best_similarity) {
            best_similarity = s;
            best_row = r;
        }
    }

    return SearchResult{person_ids[owners[best_row]], best_similarity};
}

std::unique_ptr<SearchBackend> make_backend(BackendKind kind,
                                            const std::vector<IdentityRecord>& records,
                                            int dim)
{
    switch (kind) {
        case BackendKind::BruteForce:
            return std::make_unique<BruteForceBackend>(records, dim);
        case BackendKind::Matrix:
            return std::make_unique<MatrixBackend>(records, dim);
    }
    throw std::invalid_argument("Unknown search backend");
}
