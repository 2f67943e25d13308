// ============= src/pipeline/face_pipeline.cpp =============
#include "pipeline/face_pipeline.hpp"
#include "tracking/geometry.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace {

using Clock = std::chrono::high_resolution_clock;

double elapsed_ms(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

bool is_cancelled(const std::atomic<bool>* cancel) {
    return cancel != nullptr && cancel->load();
}

// Cajas no finitas o vacías no entran al tracker
bool is_usable(const Detection& det) {
    return is_finite_box(det.box) && det.box.width > 0 && det.box.height > 0 &&
           std::isfinite(det.confidence);
}

}  // namespace

const char* to_string(FrameStatus status) {
    switch (status) {
        case FrameStatus::Processed: return "processed";
        case FrameStatus::Rejected:  return "rejected";
        case FrameStatus::Skipped:   return "skipped";
        case FrameStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ==================== CONSTRUCTOR ====================

FacePipeline::FacePipeline(const PipelineConfig& config,
                           std::shared_ptr<FaceDetector> detector,
                           std::shared_ptr<EmbeddingExtractor> embedder,
                           std::shared_ptr<PoseEstimator> pose_estimator,
                           std::shared_ptr<const SimilarityIndex> index,
                           const std::string& stream_id)
    : config(config),
      stream_id(stream_id),
      detector(std::move(detector)),
      embedder(std::move(embedder)),
      pose_estimator(std::move(pose_estimator)),
      index(std::move(index)),
      tracker(config.tracker),
      cache(config.embed_interval),
      detector_calls(config.external_timeout_ms),
      embedder_calls(config.external_timeout_ms),
      pose_calls(config.external_timeout_ms),
      next_frame_index(0)
{
    this->config.validate();

    if (!this->detector || !this->embedder || !this->index) {
        throw std::invalid_argument("FacePipeline requires detector, embedder and index");
    }

    spdlog::info("🎬 Pipeline [{}] ready", stream_id);
    spdlog::info("   Embed interval: {} frames", config.embed_interval);
    spdlog::info("   Pose: {}", this->pose_estimator ? "enabled" : "disabled");
    spdlog::info("   External timeout: {}",
                 config.external_timeout_ms > 0
                     ? std::to_string(config.external_timeout_ms) + "ms"
                     : std::string("inline"));
}

std::string FacePipeline::tag(int64_t frame_index) const {
    return "[stream=" + stream_id + "][frame=" + std::to_string(frame_index) + "]";
}

PipelineStats FacePipeline::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex);
    return stats;
}

// ==================== PROCESS ====================

FrameResult FacePipeline::process(const cv::Mat& frame, const std::atomic<bool>* cancel) {
    auto frame_start = Clock::now();

    FrameResult result;
    result.frame_index = next_frame_index++;
    const int64_t frame_index = result.frame_index;

    auto finish = [&](FrameStatus status) {
        result.status = status;
        result.timings.total_ms = elapsed_ms(frame_start);

        std::lock_guard<std::mutex> lock(stats_mutex);
        switch (status) {
            case FrameStatus::Processed: stats.frames_processed++; break;
            case FrameStatus::Rejected:  stats.frames_rejected++; break;
            case FrameStatus::Cancelled: stats.frames_cancelled++; break;
            case FrameStatus::Skipped:   break;
        }
        return result;
    };

    if (frame.empty()) {
        spdlog::warn("{} ⚠️  Empty frame rejected", tag(frame_index));
        return finish(FrameStatus::Rejected);
    }

    if (is_cancelled(cancel)) return finish(FrameStatus::Cancelled);

    // 1. Predict
    auto t = Clock::now();
    PredictionSet predictions = tracker.predict();
    result.timings.predict_ms = elapsed_ms(t);

    if (is_cancelled(cancel)) return finish(FrameStatus::Cancelled);

    // 2. Detect
    t = Clock::now();
    std::vector<Detection> detections = detect_stage(frame, frame_index);
    result.timings.detect_ms = elapsed_ms(t);

    if (is_cancelled(cancel)) return finish(FrameStatus::Cancelled);

    // 3. Associate
    t = Clock::now();
    AssociationResult association = tracker.associate(predictions, detections);
    result.timings.associate_ms = elapsed_ms(t);

    if (is_cancelled(cancel)) return finish(FrameStatus::Cancelled);

    // 4. Lifecycle (commit)
    t = Clock::now();
    TrackUpdate update = tracker.step(detections, predictions, association);

    for (int id : update.removed_ids) {
        cache.invalidate(id);
        pose_cache.erase(id);
    }
    result.timings.lifecycle_ms = elapsed_ms(t);

    // A partir de aquí el tracker ya avanzó: cancelar solo salta etapas
    bool cancelled_after_commit = is_cancelled(cancel);

    // 5. Identify
    if (!cancelled_after_commit) {
        t = Clock::now();
        identify_stage(frame, update, frame_index, cancel);
        result.timings.identify_ms = elapsed_ms(t);
        cancelled_after_commit = is_cancelled(cancel);
    }

    // 6. Behavior
    if (!cancelled_after_commit && pose_estimator) {
        t = Clock::now();
        behavior_stage(frame, update, frame_index, cancel);
        result.timings.behavior_ms = elapsed_ms(t);
        cancelled_after_commit = is_cancelled(cancel);
    }

    // 7. Assemble
    result.tracks = assemble(update, frame_index);

    finish(cancelled_after_commit ? FrameStatus::Cancelled : FrameStatus::Processed);

    spdlog::debug("{} det={} tracks={} | predict {:.2f}ms detect {:.2f}ms assoc {:.2f}ms "
                  "lifecycle {:.2f}ms identify {:.2f}ms behavior {:.2f}ms total {:.2f}ms",
                  tag(frame_index), detections.size(), result.tracks.size(),
                  result.timings.predict_ms, result.timings.detect_ms,
                  result.timings.associate_ms, result.timings.lifecycle_ms,
                  result.timings.identify_ms, result.timings.behavior_ms,
                  result.timings.total_ms);

    return result;
}

// ==================== DETECT ====================

std::vector<Detection> FacePipeline::detect_stage(const cv::Mat& frame, int64_t frame_index) {
    std::optional<std::vector<Detection>> raw;

    try {
        raw = detector_calls.run([detector = detector, frame]() {
            return detector->detect(frame);
        });
    } catch (const std::exception& e) {
        spdlog::warn("{} ⚠️  Detector failed: {}", tag(frame_index), e.what());
        std::lock_guard<std::mutex> lock(stats_mutex);
        stats.detector_failures++;
        return {};
    }

    if (!raw) {
        spdlog::warn("{} ⚠️  Detector timed out ({}ms)", tag(frame_index),
                     config.external_timeout_ms);
        std::lock_guard<std::mutex> lock(stats_mutex);
        stats.detector_failures++;
        return {};
    }

    std::vector<Detection> detections;
    detections.reserve(raw->size());
    for (const auto& det : *raw) {
        if (is_usable(det)) {
            detections.push_back(det);
        } else {
            spdlog::debug("{} Dropping degenerate detection", tag(frame_index));
        }
    }
    return detections;
}

// ==================== IDENTIFY ====================

void FacePipeline::identify_stage(const cv::Mat& frame, const TrackUpdate& update,
                                  int64_t frame_index, const std::atomic<bool>* cancel)
{
    for (const auto& report : update.tracks) {
        if (report.state != TrackState::Confirmed) continue;
        if (report.detection_index < 0 || !report.quality_ok) continue;
        if (!cache.needs_refresh(report.track_id, frame_index, report.just_confirmed)) continue;

        if (is_cancelled(cancel)) return;

        if (clip_box(report.box, frame.size()).empty()) {
            spdlog::debug("{} Track {} crop empty, skipping identity",
                          tag(frame_index), report.track_id);
            continue;
        }

        std::optional<std::vector<float>> embedding;
        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.embed_calls++;
        }

        try {
            embedding = embedder_calls.run([embedder = embedder, frame, box = report.box]() {
                return embedder->embed(frame, box);
            });
        } catch (const std::exception& e) {
            spdlog::warn("{} ⚠️  Embedding failed for track {}: {}",
                         tag(frame_index), report.track_id, e.what());
        }

        if (!embedding) {
            spdlog::warn("{} ⚠️  No embedding for track {}, keeping previous identity",
                         tag(frame_index), report.track_id);
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.embed_failures++;
            continue;
        }

        auto match = index->query(*embedding);
        if (match) {
            cache.put(report.track_id, match->person_id, match->similarity, frame_index);
            spdlog::debug("{} Track {} -> {} ({:.3f})", tag(frame_index),
                          report.track_id, match->person_id, match->similarity);
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.identities_matched++;
        } else {
            cache.put(report.track_id, std::nullopt, 0.0f, frame_index);
            spdlog::debug("{} Track {} -> unknown", tag(frame_index), report.track_id);
        }
    }
}

// ==================== BEHAVIOR ====================

void FacePipeline::behavior_stage(const cv::Mat& frame, const TrackUpdate& update,
                                  int64_t frame_index, const std::atomic<bool>* cancel)
{
    for (const auto& report : update.tracks) {
        if (report.state != TrackState::Confirmed || report.detection_index < 0) continue;

        auto it = pose_cache.find(report.track_id);
        if (it != pose_cache.end() &&
            frame_index - it->second.frame_index < config.pose_interval) {
            continue;
        }

        if (is_cancelled(cancel)) return;

        if (clip_box(report.box, frame.size()).empty()) continue;

        std::optional<std::optional<HeadPose>> pose;
        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.pose_calls++;
        }

        try {
            pose = pose_calls.run([estimator = pose_estimator, frame, box = report.box]() {
                return estimator->estimate(frame, box);
            });
        } catch (const std::exception& e) {
            spdlog::warn("{} ⚠️  Pose estimation failed for track {}: {}",
                         tag(frame_index), report.track_id, e.what());
        }

        if (!pose) {
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.pose_failures++;
            continue;
        }

        pose_cache[report.track_id] = PoseEntry{*pose, frame_index};
    }
}

// ==================== ASSEMBLE ====================

std::vector<TrackResult> FacePipeline::assemble(const TrackUpdate& update,
                                                int64_t frame_index) const
{
    std::vector<TrackResult> tracks;

    for (const auto& report : update.tracks) {
        if (report.state != TrackState::Confirmed) continue;

        TrackResult tr;
        tr.track_id = report.track_id;
        tr.box = report.box;

        if (auto cached = cache.get(report.track_id, frame_index)) {
            tr.identity = IdentityInfo{cached->person_id, cached->score,
                                       frame_index - cached->age_in_frames};
        }

        auto it = pose_cache.find(report.track_id);
        if (it != pose_cache.end()) {
            tr.pose = it->second.pose;
        }
        tr.engagement = classify_engagement(tr.pose, config.engagement);

        tracks.push_back(tr);
    }

    return tracks;
}
