// ============= include/recognition/embedding_cache.hpp =============
/*
 * Embedding Cache - identidad resuelta por track
 *
 * CARACTERÍSTICAS:
 * - track_id -> {person_id (opcional), score, frame de la última resolución}
 * - Un "no match" también se guarda: la resolución se hizo y no encontró a nadie
 * - Refresh cuando no hay entrada, cuando la entrada tiene
 *   refresh_interval frames o más, o cuando el track acaba de confirmarse
 * - Tamaño acotado por los tracks vivos: se invalida al eliminar el track,
 *   no por recencia de acceso
 *
 * No es thread-safe: cada pipeline tiene su propio cache.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

struct CachedIdentity {
    std::optional<std::string> person_id;
    float score;
    int64_t age_in_frames;
};

class EmbeddingCache {
public:
    explicit EmbeddingCache(int refresh_interval = 15);

    std::optional<CachedIdentity> get(int track_id, int64_t frame_index) const;

    void put(int track_id, const std::optional<std::string>& person_id,
             float score, int64_t frame_index);

    void invalidate(int track_id);

    bool needs_refresh(int track_id, int64_t frame_index, bool just_confirmed) const;

    size_t size() const { return entries.size(); }
    void clear() { entries.clear(); }

    int get_refresh_interval() const { return refresh_interval; }

private:
    struct Entry {
        std::optional<std::string> person_id;
        float score;
        int64_t frame_index;
    };

    int refresh_interval;
    std::unordered_map<int, Entry> entries;
};
