// ============= src/database/similarity_index.cpp =============
#include "database/similarity_index.hpp"
#include "database/catalog_store.hpp"
#include "recognition/embedding_extractor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

void IndexConfig::validate() const {
    if (embedding_dim <= 0) {
        throw std::invalid_argument("recognition.embedding_dim must be positive");
    }
    if (!(accept_threshold >= -1.0f && accept_threshold <= 1.0f)) {
        throw std::invalid_argument("recognition.accept_threshold must be in [-1, 1]");
    }
}

// ==================== CONSTRUCTOR ====================

SimilarityIndex::SimilarityIndex(const IndexConfig& config)
    : config(config)
{
    this->config.validate();
    current = build_snapshot({});

    spdlog::info("🔍 Similarity index: dim={} threshold={:.2f} backend={}",
                 config.embedding_dim, config.accept_threshold, to_string(config.backend));
}

// ==================== SNAPSHOTS ====================

std::shared_ptr<const SimilarityIndex::Snapshot> SimilarityIndex::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(snapshot_mutex);
    return current;
}

std::shared_ptr<const SimilarityIndex::Snapshot>
SimilarityIndex::build_snapshot(std::vector<IdentityRecord> records) const {
    auto next = std::make_shared<Snapshot>();
    next->backend = make_backend(config.backend, records, config.embedding_dim);
    next->records = std::move(records);
    return next;
}

void SimilarityIndex::publish(std::shared_ptr<const Snapshot> next) {
    std::unique_lock<std::shared_mutex> lock(snapshot_mutex);
    current = std::move(next);
}

// ==================== QUERY ====================

std::optional<IdentityMatch> SimilarityIndex::nearest(const std::vector<float>& embedding) const {
    if (embedding.size() != static_cast<size_t>(config.embedding_dim)) {
        spdlog::debug("Query dim {} != index dim {}", embedding.size(), config.embedding_dim);
        return std::nullopt;
    }

    std::vector<float> normalized = embedding;
    if (!EmbeddingExtractor::l2_normalize(normalized)) {
        return std::nullopt;
    }

    auto snap = snapshot();

    std::optional<SearchResult> best;
    try {
        best = snap->backend->best(normalized);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️  Similarity search failed: {}", e.what());
        return std::nullopt;
    }

    if (!best || !std::isfinite(best->similarity)) {
        return std::nullopt;
    }

    return IdentityMatch{best->person_id, best->similarity};
}

std::optional<IdentityMatch> SimilarityIndex::query(const std::vector<float>& embedding) const {
    auto best = nearest(embedding);
    if (!best || best->similarity < config.accept_threshold) {
        return std::nullopt;
    }
    return best;
}

// ==================== WRITERS ====================

void SimilarityIndex::rebuild(std::vector<IdentityRecord> records) {
    std::lock_guard<std::mutex> lock(writer_mutex);
    publish(build_snapshot(std::move(records)));
}

bool SimilarityIndex::reload(IdentityCatalogStore& store) {
    std::lock_guard<std::mutex> lock(writer_mutex);

    std::vector<IdentityRecord> loaded;
    try {
        loaded = store.load_all();
    } catch (const std::exception& e) {
        spdlog::error("❌ Catalog unavailable, keeping previous index: {}", e.what());
        return false;
    }

    auto next = build_snapshot(std::move(loaded));
    spdlog::info("✓ Index loaded: {} persons, {} references",
                 next->records.size(), next->backend->size());
    publish(std::move(next));
    return true;
}

bool SimilarityIndex::enroll(const std::string& person_id, const std::vector<float>& reference) {
    if (person_id.empty()) {
        spdlog::error("Cannot enroll empty person_id");
        return false;
    }
    if (reference.size() != static_cast<size_t>(config.embedding_dim)) {
        spdlog::error("Invalid reference size: {} (expected {})",
                      reference.size(), config.embedding_dim);
        return false;
    }
    std::vector<float> check = reference;
    if (!EmbeddingExtractor::l2_normalize(check)) {
        spdlog::error("Cannot enroll zero-norm reference for '{}'", person_id);
        return false;
    }

    std::lock_guard<std::mutex> lock(writer_mutex);

    std::vector<IdentityRecord> records = snapshot()->records;
    auto it = std::find_if(records.begin(), records.end(),
        [&person_id](const IdentityRecord& r) { return r.person_id == person_id; });

    if (it == records.end()) {
        records.push_back(IdentityRecord{person_id, {reference}});
    } else {
        it->references.push_back(reference);
    }

    publish(build_snapshot(std::move(records)));
    spdlog::debug("Enrolled reference for '{}'", person_id);
    return true;
}

bool SimilarityIndex::remove(const std::string& person_id) {
    std::lock_guard<std::mutex> lock(writer_mutex);

    std::vector<IdentityRecord> records = snapshot()->records;
    auto it = std::remove_if(records.begin(), records.end(),
        [&person_id](const IdentityRecord& r) { return r.person_id == person_id; });

    if (it == records.end()) {
        return false;
    }
    records.erase(it, records.end());

    publish(build_snapshot(std::move(records)));
    spdlog::debug("Removed '{}' from index", person_id);
    return true;
}

// ==================== STATS ====================

size_t SimilarityIndex::person_count() const {
    return snapshot()->records.size();
}

size_t SimilarityIndex::reference_count() const {
    return snapshot()->backend->size();
}

std::vector<IdentityRecord> SimilarityIndex::records() const {
    return snapshot()->records;
}
