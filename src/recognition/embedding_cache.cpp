// ============= src/recognition/embedding_cache.cpp =============
#include "recognition/embedding_cache.hpp"
#include <stdexcept>

EmbeddingCache::EmbeddingCache(int refresh_interval)
    : refresh_interval(refresh_interval)
{
    if (refresh_interval < 1) {
        throw std::invalid_argument("embed_interval must be >= 1");
    }
}

std::optional<CachedIdentity> EmbeddingCache::get(int track_id, int64_t frame_index) const {
    auto it = entries.find(track_id);
    if (it == entries.end()) {
        return std::nullopt;
    }

    const Entry& e = it->second;
    return CachedIdentity{e.person_id, e.score, frame_index - e.frame_index};
}

void EmbeddingCache::put(int track_id, const std::optional<std::string>& person_id,
                         float score, int64_t frame_index)
{
    entries[track_id] = Entry{person_id, score, frame_index};
}

void EmbeddingCache::invalidate(int track_id) {
    entries.erase(track_id);
}

bool EmbeddingCache::needs_refresh(int track_id, int64_t frame_index,
                                   bool just_confirmed) const
{
    if (just_confirmed) return true;

    auto it = entries.find(track_id);
    if (it == entries.end()) return true;

    return frame_index - it->second.frame_index >= refresh_interval;
}
