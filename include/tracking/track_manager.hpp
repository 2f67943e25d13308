// ============= include/tracking/track_manager.hpp =============
/*
 * Track Manager - ciclo de vida de tracks
 *
 * ESTADOS:
 *   (nuevo) -> Tentative : detección sin asignar, confianza >= creation_confidence
 *                          y quality_ok
 *   Tentative -> Confirmed : min_hits asociaciones consecutivas
 *                            (la detección que lo crea cuenta como la primera)
 *   Tentative -> Removed   : cualquier miss antes de confirmar (silencioso)
 *   Confirmed -> Lost      : lost_grace_frames misses consecutivos
 *   Lost -> Confirmed      : re-asociación dentro de la ventana
 *   Lost -> Removed        : time_since_update > max_lost_frames
 *
 * CARACTERÍSTICAS:
 * - Único dueño de los tracks; IDs monotónicos desde 1, nunca reutilizados
 * - predict() / associate() const, commit en step()
 * - step() atómico: el nuevo estado se construye en una copia y se
 *   intercambia al final
 * - No reentrante: step() concurrente en la misma instancia -> logic_error
 */

#pragma once
#include "tracking/associator.hpp"
#include "tracking/motion_model.hpp"
#include "tracking/track.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

struct TrackerConfig {
    float min_iou = 0.3f;
    float creation_confidence = 0.5f;
    int min_hits = 3;
    int lost_grace_frames = 1;
    int max_lost_frames = 30;

    // Lanza std::invalid_argument si algún valor está fuera de rango
    void validate() const;
};

struct PredictedTrack {
    int track_id;
    cv::Rect2f box;
    float uncertainty;
    MotionState motion;
};

struct PredictionSet {
    uint64_t generation = 0;
    std::vector<PredictedTrack> tracks;

    std::vector<cv::Rect2f> boxes() const;
};

struct TrackReport {
    int track_id;
    cv::Rect2f box;
    TrackState state;
    bool just_confirmed;
    int detection_index;     // -1 si no se asoció en este frame
    bool quality_ok;
};

struct TrackUpdate {
    std::vector<TrackReport> tracks;
    std::vector<int> removed_ids;
    std::vector<int> confirmed_ids;
};

class TrackManager {
public:
    explicit TrackManager(const TrackerConfig& config,
                          std::shared_ptr<const MotionModel> motion = nullptr,
                          std::shared_ptr<const AssociationCost> cost = nullptr);

    PredictionSet predict() const;

    AssociationResult associate(const PredictionSet& predictions,
                                const std::vector<Detection>& detections) const;

    TrackUpdate step(const std::vector<Detection>& detections);

    TrackUpdate step(const std::vector<Detection>& detections,
                     const PredictionSet& predictions,
                     const AssociationResult& association);

    const Track* find(int track_id) const;
    const std::map<int, Track>& tracks() const { return live_tracks; }
    size_t size() const { return live_tracks.size(); }

    int get_total_tracks() const { return next_id - 1; }
    const TrackerConfig& get_config() const { return config; }

private:
    TrackerConfig config;
    std::shared_ptr<const MotionModel> motion;
    Associator associator;

    std::map<int, Track> live_tracks;   // keyed by track_id
    int next_id;
    uint64_t generation;

    std::atomic<bool> stepping;

    bool should_create(const Detection& det) const;
};
