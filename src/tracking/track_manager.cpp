// ============= src/tracking/track_manager.cpp =============
#include "tracking/track_manager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace {

// Marca la instancia como ocupada mientras dura un step()
class StepGuard {
public:
    explicit StepGuard(std::atomic<bool>& flag) : flag(flag) {
        if (flag.exchange(true)) {
            throw std::logic_error("TrackManager::step called concurrently on the same instance");
        }
    }
    ~StepGuard() { flag.store(false); }

    StepGuard(const StepGuard&) = delete;
    StepGuard& operator=(const StepGuard&) = delete;

private:
    std::atomic<bool>& flag;
};

}  // namespace

const char* to_string(TrackState state) {
    switch (state) {
        case TrackState::Tentative: return "tentative";
        case TrackState::Confirmed: return "confirmed";
        case TrackState::Lost:      return "lost";
        case TrackState::Removed:   return "removed";
    }
    return "unknown";
}

// ==================== TrackerConfig ====================

void TrackerConfig::validate() const {
    if (!(min_iou >= 0.0f && min_iou <= 1.0f)) {
        throw std::invalid_argument("tracker.min_iou must be in [0, 1]");
    }
    if (!(creation_confidence >= 0.0f && creation_confidence <= 1.0f)) {
        throw std::invalid_argument("tracker.creation_confidence must be in [0, 1]");
    }
    if (min_hits < 1) {
        throw std::invalid_argument("tracker.min_hits must be >= 1");
    }
    if (lost_grace_frames < 1) {
        throw std::invalid_argument("tracker.lost_grace_frames must be >= 1");
    }
    if (max_lost_frames < 0) {
        throw std::invalid_argument("tracker.max_lost_frames must be >= 0");
    }
}

std::vector<cv::Rect2f> PredictionSet::boxes() const {
    std::vector<cv::Rect2f> result;
    result.reserve(tracks.size());
    for (const auto& t : tracks) {
        result.push_back(t.box);
    }
    return result;
}

// ==================== TrackManager ====================

TrackManager::TrackManager(const TrackerConfig& config,
                           std::shared_ptr<const MotionModel> motion,
                           std::shared_ptr<const AssociationCost> cost)
    : config(config),
      motion(motion ? std::move(motion)
                    : std::shared_ptr<const MotionModel>(std::make_shared<KalmanBoxModel>())),
      associator(cost ? std::move(cost)
                      : std::shared_ptr<const AssociationCost>(std::make_shared<IouCost>(config.min_iou))),
      next_id(1),
      generation(0),
      stepping(false)
{
    this->config.validate();

    spdlog::debug("🎯 Track manager: min_iou={} min_hits={} lost_grace={} max_lost={}",
                  config.min_iou, config.min_hits,
                  config.lost_grace_frames, config.max_lost_frames);
}

PredictionSet TrackManager::predict() const {
    PredictionSet set;
    set.generation = generation;
    set.tracks.reserve(live_tracks.size());

    for (const auto& [id, track] : live_tracks) {
        PredictedTrack pred;
        pred.track_id = id;
        pred.motion = motion->predict(track.motion);
        pred.box = motion->to_box(pred.motion);
        pred.uncertainty = pred.motion.uncertainty();
        set.tracks.push_back(pred);
    }

    return set;
}

AssociationResult TrackManager::associate(const PredictionSet& predictions,
                                          const std::vector<Detection>& detections) const
{
    return associator.associate(predictions.boxes(), detections);
}

bool TrackManager::should_create(const Detection& det) const {
    return det.quality_ok && det.confidence >= config.creation_confidence;
}

const Track* TrackManager::find(int track_id) const {
    auto it = live_tracks.find(track_id);
    if (it == live_tracks.end()) return nullptr;
    return &it->second;
}

TrackUpdate TrackManager::step(const std::vector<Detection>& detections) {
    PredictionSet predictions = predict();
    AssociationResult association = associate(predictions, detections);
    return step(detections, predictions, association);
}

TrackUpdate TrackManager::step(const std::vector<Detection>& detections,
                               const PredictionSet& predictions,
                               const AssociationResult& association)
{
    StepGuard guard(stepping);

    if (predictions.generation != generation ||
        predictions.tracks.size() != live_tracks.size()) {
        throw std::logic_error("TrackManager::step received a stale prediction set");
    }

    const int num_preds = static_cast<int>(predictions.tracks.size());
    const int num_dets = static_cast<int>(detections.size());

    // Trabajar sobre una copia; se intercambia solo si todo sale bien
    std::map<int, Track> scratch = live_tracks;
    int scratch_next_id = next_id;

    TrackUpdate update;
    std::vector<bool> track_matched(num_preds, false);

    // 1. Tracks asociados
    for (const auto& [t_idx, d_idx] : association.matches) {
        if (t_idx < 0 || t_idx >= num_preds || d_idx < 0 || d_idx >= num_dets) {
            throw std::logic_error("TrackManager::step received an out-of-range match");
        }
        track_matched[t_idx] = true;

        const PredictedTrack& pred = predictions.tracks[t_idx];
        const Detection& det = detections[d_idx];
        Track& track = scratch.at(pred.track_id);

        track.motion = motion->update(pred.motion, det.box, det.confidence);
        track.box = det.box;
        track.confidence = det.confidence;
        track.quality_ok = det.quality_ok;
        track.age++;
        track.hits++;
        track.consecutive_hits++;
        track.consecutive_misses = 0;
        track.time_since_update = 0;

        bool just_confirmed = false;
        if (track.state == TrackState::Tentative &&
            track.consecutive_hits >= config.min_hits) {
            track.state = TrackState::Confirmed;
            just_confirmed = true;
            update.confirmed_ids.push_back(track.id);
            spdlog::debug("✓ Track {} confirmed", track.id);
        } else if (track.state == TrackState::Lost) {
            track.state = TrackState::Confirmed;
            spdlog::debug("↺ Track {} recovered", track.id);
        }

        update.tracks.push_back({track.id, track.box, track.state,
                                 just_confirmed, d_idx, track.quality_ok});
    }

    // 2. Tracks sin asociar: avanzan con la predicción
    for (int t_idx = 0; t_idx < num_preds; t_idx++) {
        if (track_matched[t_idx]) continue;

        const PredictedTrack& pred = predictions.tracks[t_idx];
        Track& track = scratch.at(pred.track_id);

        track.motion = pred.motion;
        track.age++;
        track.time_since_update++;
        track.consecutive_misses++;
        track.consecutive_hits = 0;

        if (track.state == TrackState::Tentative) {
            spdlog::debug("✗ Tentative track {} dropped", track.id);
            update.removed_ids.push_back(track.id);
            scratch.erase(pred.track_id);
            continue;
        }

        if (track.time_since_update > config.max_lost_frames) {
            spdlog::debug("✗ Track {} removed after {} frames without update",
                          track.id, track.time_since_update);
            update.tracks.push_back({track.id, pred.box, TrackState::Removed,
                                     false, -1, false});
            update.removed_ids.push_back(track.id);
            scratch.erase(pred.track_id);
            continue;
        }

        if (track.state == TrackState::Confirmed &&
            track.consecutive_misses >= config.lost_grace_frames) {
            track.state = TrackState::Lost;
            spdlog::debug("… Track {} lost", track.id);
        }

        update.tracks.push_back({track.id, pred.box, track.state,
                                 false, -1, false});
    }

    // 3. Nuevos tracks
    std::vector<int> unmatched = association.unmatched_detections;
    std::sort(unmatched.begin(), unmatched.end());

    for (int d_idx : unmatched) {
        if (d_idx < 0 || d_idx >= num_dets) {
            throw std::logic_error("TrackManager::step received an out-of-range detection index");
        }
        const Detection& det = detections[d_idx];
        if (!should_create(det)) continue;

        Track track;
        track.id = scratch_next_id++;
        track.motion = motion->initiate(det.box);
        track.box = det.box;
        track.confidence = det.confidence;
        track.quality_ok = det.quality_ok;
        track.age = 1;
        track.hits = 1;
        track.consecutive_hits = 1;

        bool just_confirmed = false;
        if (config.min_hits <= 1) {
            track.state = TrackState::Confirmed;
            just_confirmed = true;
            update.confirmed_ids.push_back(track.id);
        }

        spdlog::debug("+ Track {} created ({:.2f})", track.id, det.confidence);
        update.tracks.push_back({track.id, track.box, track.state,
                                 just_confirmed, d_idx, track.quality_ok});
        scratch.emplace(track.id, track);
    }

    std::sort(update.tracks.begin(), update.tracks.end(),
              [](const TrackReport& a, const TrackReport& b) {
                  return a.track_id < b.track_id;
              });
    std::sort(update.removed_ids.begin(), update.removed_ids.end());

    // Commit
    live_tracks.swap(scratch);
    next_id = scratch_next_id;
    generation++;

    return update;
}
