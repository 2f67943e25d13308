// ============= include/database/similarity_index.hpp =============
/*
 * Similarity Index - resolución de identidad por nearest neighbor
 *
 * CARACTERÍSTICAS:
 * - query(embedding) -> {person_id, similarity} o "no match"
 * - Match solo si similarity >= accept_threshold (nunca un "casi" match)
 * - Vector cero o dimensión incorrecta -> no match
 * - Snapshot inmutable: enroll / remove / rebuild / reload construyen un
 *   snapshot nuevo y lo publican; las queries en curso siguen leyendo el suyo
 * - Compartido entre streams (std::shared_ptr)
 *
 * Si el catálogo no se puede cargar se conserva el snapshot anterior
 * (vacío si no había) y las queries responden "no match".
 */

#pragma once
#include "database/vector_index.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

class IdentityCatalogStore;

struct IndexConfig {
    int embedding_dim = 128;
    float accept_threshold = 0.55f;
    BackendKind backend = BackendKind::Matrix;

    void validate() const;
};

struct IdentityMatch {
    std::string person_id;
    float similarity;
};

class SimilarityIndex {
public:
    explicit SimilarityIndex(const IndexConfig& config);

    // Mejor identidad aceptada
    std::optional<IdentityMatch> query(const std::vector<float>& embedding) const;

    // Mejor candidato sin aplicar el umbral
    std::optional<IdentityMatch> nearest(const std::vector<float>& embedding) const;

    void rebuild(std::vector<IdentityRecord> records);

    // Recarga desde el store; false (y snapshot intacto) si el store falla
    bool reload(IdentityCatalogStore& store);

    bool enroll(const std::string& person_id, const std::vector<float>& reference);
    bool remove(const std::string& person_id);

    size_t person_count() const;
    size_t reference_count() const;
    std::vector<IdentityRecord> records() const;

    const IndexConfig& get_config() const { return config; }

private:
    struct Snapshot {
        std::vector<IdentityRecord> records;
        std::shared_ptr<const SearchBackend> backend;
    };

    IndexConfig config;

    mutable std::shared_mutex snapshot_mutex;   // protege el puntero, no el contenido
    std::shared_ptr<const Snapshot> current;

    std::mutex writer_mutex;                    // serializa escritores

    std::shared_ptr<const Snapshot> snapshot() const;
    std::shared_ptr<const Snapshot> build_snapshot(std::vector<IdentityRecord> records) const;
    void publish(std::shared_ptr<const Snapshot> next);
};
