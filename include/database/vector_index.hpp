// ============= include/database/vector_index.hpp =============
/*
 * Vector Index - backends de búsqueda exacta por cosine similarity
 *
 * BACKENDS:
 * - BruteForceBackend: recorre todas las referencias (baseline de corrección)
 * - MatrixBackend: referencias normalizadas en una matriz contigua N x D,
 *   un solo GEMV (cv::gemm) por query
 *
 * Ambos son exactos y coinciden dentro de la tolerancia de float.
 * Varias referencias por persona: el score de la persona es el máximo.
 * En empate gana la primera referencia en orden de carga.
 *
 * Referencias con norma cero o dimensión incorrecta se descartan al construir.
 * Los backends son inmutables: para cambiar el catálogo se construye otro.
 */

#pragma once
#include <opencv2/core.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ==================== STRUCTS ====================

struct IdentityRecord {
    std::string person_id;
    std::vector<std::vector<float>> references;
};

struct SearchResult {
    std::string person_id;
    float similarity;
};

enum class BackendKind {
    BruteForce,
    Matrix
};

const char* to_string(BackendKind kind);

// Lanza std::invalid_argument si el nombre no es válido
BackendKind backend_from_string(const std::string& name);

// ==================== BACKENDS ====================

class SearchBackend {
public:
    virtual ~SearchBackend() = default;

    // La query debe venir ya normalizada (L2) y con la dimensión del índice
    virtual std::optional<SearchResult> best(const std::vector<float>& normalized_query) const = 0;

    virtual size_t size() const = 0;
    virtual const char* name() const = 0;
};

class BruteForceBackend : public SearchBackend {
public:
    BruteForceBackend(const std::vector<IdentityRecord>& records, int dim);

    std::optional<SearchResult> best(const std::vector<float>& normalized_query) const override;
    size_t size() const override { return references.size(); }
    const char* name() const override { return "brute_force"; }

private:
    int dim;
    std::vector<std::string> person_ids;
    std::vector<std::pair<int, std::vector<float>>> references;   // (person idx, vector)
};

class MatrixBackend : public SearchBackend {
public:
    MatrixBackend(const std::vector<IdentityRecord>& records, int dim);

    std::optional<SearchResult> best(const std::vector<float>& normalized_query) const override;
    size_t size() const override { return static_cast<size_t>(matrix.rows); }
    const char* name() const override { return "matrix"; }

private:
    int dim;
    std::vector<std::string> person_ids;
    std::vector<int> owners;    // fila -> person idx
    cv::Mat matrix;             // N x D, CV_32F, filas normalizadas
};

std::unique_ptr<SearchBackend> make_backend(BackendKind kind,
                                            const std::vector<IdentityRecord>& records,
                                            int dim);
