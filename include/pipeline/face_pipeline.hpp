// ============= include/pipeline/face_pipeline.hpp =============
/*
 * Face Pipeline - orquestador por frame
 *
 * ETAPAS (orden fijo):
 *   predict -> detect -> associate -> lifecycle -> identify -> behavior -> assemble
 *
 * CARACTERÍSTICAS:
 * - Un pipeline por stream; frames estrictamente secuenciales
 * - Llamadas externas (detector, embedder, pose) con timeout vía CallRunner
 * - Fallo o timeout externo: la etapa se salta en ese frame, el tracking
 *   sigue con las predicciones
 * - Identidad solo para tracks Confirmed asociados en el frame, con
 *   quality_ok, según la política del EmbeddingCache
 * - Pose cada pose_interval frames por track; en medio se reutiliza
 * - Resultado: solo tracks Confirmed
 * - Cancelación entre etapas: antes del commit el tracker queda intacto;
 *   después solo se saltan las etapas restantes
 * - Frame vacío -> Rejected, tracks intactos
 *
 * PERFORMANCE:
 * - Tiempos por etapa en cada FrameResult (ms)
 * - Línea de debug por frame con prefijo [stream=..][frame=..]
 */

#pragma once
#include "behavior/engagement.hpp"
#include "behavior/pose_estimator.hpp"
#include "config.hpp"
#include "database/similarity_index.hpp"
#include "detection/detector.hpp"
#include "pipeline/call_runner.hpp"
#include "recognition/embedding_cache.hpp"
#include "recognition/embedding_extractor.hpp"
#include "tracking/track_manager.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct StageTimings {
    double predict_ms = 0;
    double detect_ms = 0;
    double associate_ms = 0;
    double lifecycle_ms = 0;
    double identify_ms = 0;
    double behavior_ms = 0;
    double total_ms = 0;
};

enum class FrameStatus {
    Processed,
    Rejected,     // frame malformado
    Skipped,      // reemplazado por un frame más nuevo antes de procesarse
    Cancelled
};

const char* to_string(FrameStatus status);

struct IdentityInfo {
    std::optional<std::string> person_id;   // nullopt = resuelto como desconocido
    float score;
    int64_t frame_index;                    // frame de la última resolución
};

struct TrackResult {
    int track_id;
    cv::Rect2f box;
    std::optional<IdentityInfo> identity;   // nullopt = aún sin resolver
    std::optional<HeadPose> pose;
    Engagement engagement = Engagement::Unknown;
};

struct FrameResult {
    int64_t frame_index = -1;
    FrameStatus status = FrameStatus::Processed;
    StageTimings timings;
    std::vector<TrackResult> tracks;
};

struct PipelineStats {
    uint64_t frames_processed = 0;
    uint64_t frames_rejected = 0;
    uint64_t frames_cancelled = 0;
    uint64_t detector_failures = 0;
    uint64_t embed_calls = 0;
    uint64_t embed_failures = 0;
    uint64_t identities_matched = 0;
    uint64_t pose_calls = 0;
    uint64_t pose_failures = 0;
};

class FacePipeline {
public:
    // pose_estimator puede ser nullptr (engagement = unknown)
    FacePipeline(const PipelineConfig& config,
                 std::shared_ptr<FaceDetector> detector,
                 std::shared_ptr<EmbeddingExtractor> embedder,
                 std::shared_ptr<PoseEstimator> pose_estimator,
                 std::shared_ptr<const SimilarityIndex> index,
                 const std::string& stream_id = "default");

    FacePipeline(const FacePipeline&) = delete;
    FacePipeline& operator=(const FacePipeline&) = delete;

    FrameResult process(const cv::Mat& frame, const std::atomic<bool>* cancel = nullptr);

    const TrackManager& get_tracker() const { return tracker; }
    const EmbeddingCache& get_cache() const { return cache; }
    const std::string& get_stream_id() const { return stream_id; }
    int64_t get_frame_count() const { return next_frame_index; }

    PipelineStats get_stats() const;

private:
    struct PoseEntry {
        std::optional<HeadPose> pose;
        int64_t frame_index;
    };

    PipelineConfig config;
    std::string stream_id;

    std::shared_ptr<FaceDetector> detector;
    std::shared_ptr<EmbeddingExtractor> embedder;
    std::shared_ptr<PoseEstimator> pose_estimator;
    std::shared_ptr<const SimilarityIndex> index;

    TrackManager tracker;
    EmbeddingCache cache;
    std::map<int, PoseEntry> pose_cache;

    CallRunner detector_calls;
    CallRunner embedder_calls;
    CallRunner pose_calls;

    int64_t next_frame_index;

    mutable std::mutex stats_mutex;
    PipelineStats stats;

    std::vector<Detection> detect_stage(const cv::Mat& frame, int64_t frame_index);
    void identify_stage(const cv::Mat& frame, const TrackUpdate& update,
                        int64_t frame_index, const std::atomic<bool>* cancel);
    void behavior_stage(const cv::Mat& frame, const TrackUpdate& update,
                        int64_t frame_index, const std::atomic<bool>* cancel);
    std::vector<TrackResult> assemble(const TrackUpdate& update, int64_t frame_index) const;

    std::string tag(int64_t frame_index) const;
};
