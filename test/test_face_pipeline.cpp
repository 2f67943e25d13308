// ============= test/test_face_pipeline.cpp =============
#include "pipeline/face_pipeline.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <limits>
#include <memory>
#include <thread>

namespace {

constexpr int DIM = 8;
const cv::Rect2f FACE(200, 150, 80, 80);

PipelineConfig make_config(int min_hits = 3, int embed_interval = 15) {
    PipelineConfig cfg;
    cfg.tracker.min_hits = min_hits;
    cfg.index.embedding_dim = DIM;
    cfg.embed_interval = embed_interval;
    return cfg;
}

cv::Mat blank_frame() {
    return cv::Mat(480, 640, CV_8UC3, cv::Scalar::all(0));
}

std::shared_ptr<SimilarityIndex> make_index(const PipelineConfig& cfg) {
    auto index = std::make_shared<SimilarityIndex>(cfg.index);
    index->enroll("alice", unit_vector(DIM, 0));
    index->enroll("bob", unit_vector(DIM, 1));
    return index;
}

struct Harness {
    PipelineConfig cfg;
    std::shared_ptr<ScriptedDetector> detector;
    std::shared_ptr<FakeEmbedder> embedder;
    std::shared_ptr<FakePoseEstimator> pose;
    std::unique_ptr<FacePipeline> pipeline;

    Harness(const PipelineConfig& config,
            ScriptedDetector::Script script,
            std::vector<float> embedding = unit_vector(DIM, 0),
            std::optional<HeadPose> head_pose = std::nullopt,
            bool with_pose = false)
        : cfg(config),
          detector(std::make_shared<ScriptedDetector>(std::move(script))),
          embedder(std::make_shared<FakeEmbedder>(std::move(embedding))),
          pose(with_pose ? std::make_shared<FakePoseEstimator>(head_pose) : nullptr)
    {
        pipeline = std::make_unique<FacePipeline>(cfg, detector, embedder, pose,
                                                  make_index(cfg), "test");
    }

    FrameResult run(const std::atomic<bool>* cancel = nullptr) {
        return pipeline->process(blank_frame(), cancel);
    }
};

}  // namespace

TEST(FacePipeline, RequiresCollaborators) {
    PipelineConfig cfg = make_config();
    auto detector = std::make_shared<ScriptedDetector>(steady_face(FACE));
    auto embedder = std::make_shared<FakeEmbedder>(unit_vector(DIM, 0));
    auto index = make_index(cfg);

    EXPECT_THROW(FacePipeline(cfg, nullptr, embedder, nullptr, index), std::invalid_argument);
    EXPECT_THROW(FacePipeline(cfg, detector, nullptr, nullptr, index), std::invalid_argument);
    EXPECT_THROW(FacePipeline(cfg, detector, embedder, nullptr, nullptr), std::invalid_argument);

    cfg.embed_interval = 0;
    EXPECT_THROW(FacePipeline(cfg, detector, embedder, nullptr, index), std::invalid_argument);
}

TEST(FacePipeline, EmptyFrameIsRejectedWithoutTouchingTracks) {
    Harness h(make_config(1), steady_face(FACE));
    h.run();
    ASSERT_EQ(h.pipeline->get_tracker().size(), 1u);

    FrameResult result = h.pipeline->process(cv::Mat());
    EXPECT_EQ(result.status, FrameStatus::Rejected);
    EXPECT_EQ(result.frame_index, 1);
    EXPECT_TRUE(result.tracks.empty());
    EXPECT_EQ(h.detector->calls.load(), 1);

    const Track* track = h.pipeline->get_tracker().find(1);
    ASSERT_NE(track, nullptr);
    EXPECT_EQ(track->time_since_update, 0);
    EXPECT_EQ(h.pipeline->get_stats().frames_rejected, 1u);
}

TEST(FacePipeline, OnlyConfirmedTracksAreReported) {
    Harness h(make_config(3), steady_face(FACE));

    EXPECT_TRUE(h.run().tracks.empty());
    EXPECT_TRUE(h.run().tracks.empty());

    FrameResult third = h.run();
    EXPECT_EQ(third.status, FrameStatus::Processed);
    EXPECT_EQ(third.frame_index, 2);
    ASSERT_EQ(third.tracks.size(), 1u);
    EXPECT_EQ(third.tracks[0].track_id, 1);
    EXPECT_NEAR(third.tracks[0].box.x, FACE.x, 1e-3f);
}

TEST(FacePipeline, IdentityResolvedOnConfirmation) {
    Harness h(make_config(3), steady_face(FACE));

    h.run();
    h.run();
    EXPECT_EQ(h.embedder->calls.load(), 0);

    FrameResult result = h.run();
    EXPECT_EQ(h.embedder->calls.load(), 1);

    ASSERT_EQ(result.tracks.size(), 1u);
    const auto& identity = result.tracks[0].identity;
    ASSERT_TRUE(identity.has_value());
    ASSERT_TRUE(identity->person_id.has_value());
    EXPECT_EQ(*identity->person_id, "alice");
    EXPECT_NEAR(identity->score, 1.0f, 1e-5f);
    EXPECT_EQ(identity->frame_index, 2);
    EXPECT_EQ(h.pipeline->get_stats().identities_matched, 1u);
}

TEST(FacePipeline, UnmatchedEmbeddingResolvesToUnknown) {
    Harness h(make_config(1), steady_face(FACE), unit_vector(DIM, 5));

    FrameResult result = h.run();
    ASSERT_EQ(result.tracks.size(), 1u);
    ASSERT_TRUE(result.tracks[0].identity.has_value());
    EXPECT_FALSE(result.tracks[0].identity->person_id.has_value());
}

TEST(FacePipeline, IdentityRefreshFollowsEmbedInterval) {
    Harness h(make_config(1, 5), steady_face(FACE));

    // Confirmado en el frame 0: embeds en 0, 5, 10
    for (int frame = 0; frame < 11; frame++) {
        FrameResult result = h.run();
        ASSERT_EQ(result.tracks.size(), 1u);
        ASSERT_TRUE(result.tracks[0].identity.has_value());
        EXPECT_EQ(result.tracks[0].identity->frame_index, frame - frame % 5) << "frame " << frame;
    }
    EXPECT_EQ(h.embedder->calls.load(), 3);
    EXPECT_EQ(h.pipeline->get_cache().size(), 1u);
}

TEST(FacePipeline, EmbedderFailureKeepsPreviousIdentity) {
    Harness h(make_config(1, 1), steady_face(FACE));
    h.embedder->fail_from = 1;

    FrameResult first = h.run();
    ASSERT_EQ(first.tracks.size(), 1u);
    ASSERT_TRUE(first.tracks[0].identity.has_value());

    FrameResult second = h.run();
    EXPECT_EQ(second.status, FrameStatus::Processed);
    ASSERT_EQ(second.tracks.size(), 1u);
    ASSERT_TRUE(second.tracks[0].identity.has_value());
    EXPECT_EQ(second.tracks[0].identity->person_id.value_or(""), "alice");
    EXPECT_EQ(second.tracks[0].identity->frame_index, 0);
    EXPECT_EQ(h.pipeline->get_stats().embed_failures, 1u);
}

TEST(FacePipeline, LowQualityFacesAreTrackedButNotIdentified) {
    Harness h(make_config(1), [](int call) {
        // Frame 0 crea el track; luego el rostro queda demasiado pequeño
        return std::vector<Detection>{Detection(FACE, 0.9f, call == 0)};
    });
    h.embedder->fail_from = 0;   // solo interesa contar llamadas

    h.run();
    EXPECT_EQ(h.embedder->calls.load(), 1);

    FrameResult result = h.run();
    ASSERT_EQ(result.tracks.size(), 1u);
    EXPECT_EQ(h.embedder->calls.load(), 1);
}

TEST(FacePipeline, DetectorFailureFallsBackToPredictions) {
    Harness h(make_config(1), [](int call) -> std::vector<Detection> {
        if (call == 1) throw std::runtime_error("detector crashed");
        return {Detection(FACE, 0.9f)};
    });

    FrameResult first = h.run();
    ASSERT_EQ(first.tracks.size(), 1u);

    FrameResult failed = h.run();
    EXPECT_EQ(failed.status, FrameStatus::Processed);
    EXPECT_TRUE(failed.tracks.empty());   // el track pasa a Lost
    EXPECT_EQ(h.pipeline->get_tracker().size(), 1u);
    EXPECT_EQ(h.pipeline->get_stats().detector_failures, 1u);

    FrameResult recovered = h.run();
    ASSERT_EQ(recovered.tracks.size(), 1u);
    EXPECT_EQ(recovered.tracks[0].track_id, 1);
}

TEST(FacePipeline, DegenerateDetectionsAreDropped) {
    Harness h(make_config(1), [](int) {
        return std::vector<Detection>{
            Detection(cv::Rect2f(10, 10, 0, 20), 0.9f),
            Detection(cv::Rect2f(10, 10, std::numeric_limits<float>::infinity(), 20), 0.9f),
            Detection(FACE, 0.9f),
        };
    });

    FrameResult result = h.run();
    ASSERT_EQ(result.tracks.size(), 1u);
    EXPECT_EQ(h.pipeline->get_tracker().get_total_tracks(), 1);
}

TEST(FacePipeline, FaceOutsideFrameSkipsIdentity) {
    Harness h(make_config(1), steady_face(cv::Rect2f(700, 500, 50, 50)));

    FrameResult result = h.run();
    ASSERT_EQ(result.tracks.size(), 1u);
    EXPECT_FALSE(result.tracks[0].identity.has_value());
    EXPECT_EQ(h.embedder->calls.load(), 0);
}

TEST(FacePipeline, CancelBeforeCommitLeavesTrackerUntouched) {
    Harness h(make_config(1), steady_face(FACE));
    std::atomic<bool> cancel{true};

    FrameResult result = h.run(&cancel);
    EXPECT_EQ(result.status, FrameStatus::Cancelled);
    EXPECT_TRUE(result.tracks.empty());
    EXPECT_EQ(h.pipeline->get_tracker().size(), 0u);
    EXPECT_EQ(h.pipeline->get_tracker().get_total_tracks(), 0);
    EXPECT_EQ(h.pipeline->get_stats().frames_cancelled, 1u);
}

TEST(FacePipeline, CancelDuringDetectionDiscardsFrame) {
    std::atomic<bool> cancel{false};
    Harness h(make_config(1), [&cancel](int) {
        cancel = true;
        return std::vector<Detection>{Detection(FACE, 0.9f)};
    });

    FrameResult result = h.run(&cancel);
    EXPECT_EQ(result.status, FrameStatus::Cancelled);
    EXPECT_EQ(h.pipeline->get_tracker().size(), 0u);
}

TEST(FacePipeline, EngagementFromPose) {
    Harness h(make_config(1), steady_face(FACE), unit_vector(DIM, 0),
              HeadPose{0.0f, 25.0f, 0.0f}, true);

    FrameResult result = h.run();
    ASSERT_EQ(result.tracks.size(), 1u);
    ASSERT_TRUE(result.tracks[0].pose.has_value());
    EXPECT_FLOAT_EQ(result.tracks[0].pose->yaw, 25.0f);
    EXPECT_EQ(result.tracks[0].engagement, Engagement::Medium);
}

TEST(FacePipeline, PoseReusedBetweenIntervals) {
    PipelineConfig cfg = make_config(1);
    cfg.pose_interval = 3;
    Harness h(cfg, steady_face(FACE), unit_vector(DIM, 0), HeadPose{0.0f, 0.0f, 0.0f}, true);

    for (int i = 0; i < 6; i++) {
        FrameResult result = h.run();
        ASSERT_EQ(result.tracks.size(), 1u);
        EXPECT_EQ(result.tracks[0].engagement, Engagement::High);
    }
    EXPECT_EQ(h.pose->calls.load(), 2);
}

TEST(FacePipeline, MissingPoseIsUnknownEngagement) {
    Harness with_estimator(make_config(1), steady_face(FACE), unit_vector(DIM, 0),
                           std::nullopt, true);
    FrameResult result = with_estimator.run();
    ASSERT_EQ(result.tracks.size(), 1u);
    EXPECT_FALSE(result.tracks[0].pose.has_value());
    EXPECT_EQ(result.tracks[0].engagement, Engagement::Unknown);

    Harness without_estimator(make_config(1), steady_face(FACE));
    result = without_estimator.run();
    ASSERT_EQ(result.tracks.size(), 1u);
    EXPECT_EQ(result.tracks[0].engagement, Engagement::Unknown);
}

TEST(FacePipeline, RemovedTracksLeaveTheCache) {
    PipelineConfig cfg = make_config(1);
    cfg.tracker.max_lost_frames = 2;
    Harness h(cfg, [](int call) {
        if (call == 0) return std::vector<Detection>{Detection(FACE, 0.9f)};
        return std::vector<Detection>{};
    });

    h.run();
    EXPECT_EQ(h.pipeline->get_cache().size(), 1u);

    h.run();
    h.run();
    h.run();   // time_since_update = 3 > 2
    EXPECT_EQ(h.pipeline->get_tracker().size(), 0u);
    EXPECT_EQ(h.pipeline->get_cache().size(), 0u);
}

TEST(FacePipeline, ExternalTimeoutSkipsStage) {
    PipelineConfig cfg = make_config(1);
    cfg.external_timeout_ms = 20;
    Harness h(cfg, [](int call) {
        if (call == 1) std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return std::vector<Detection>{Detection(FACE, 0.9f)};
    });

    ASSERT_EQ(h.run().tracks.size(), 1u);

    FrameResult slow = h.run();
    EXPECT_EQ(slow.status, FrameStatus::Processed);
    EXPECT_EQ(h.pipeline->get_stats().detector_failures, 1u);
    EXPECT_EQ(h.pipeline->get_tracker().size(), 1u);
}
