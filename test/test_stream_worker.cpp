// ============= test/test_stream_worker.cpp =============
#include "pipeline/stream_worker.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace {

constexpr int DIM = 8;
const cv::Rect2f FACE(200, 150, 80, 80);

cv::Mat blank_frame() {
    return cv::Mat(240, 320, CV_8UC3, cv::Scalar::all(0));
}

std::unique_ptr<FacePipeline> make_pipeline(std::shared_ptr<FaceDetector> detector) {
    PipelineConfig cfg;
    cfg.tracker.min_hits = 1;
    cfg.index.embedding_dim = DIM;

    auto index = std::make_shared<SimilarityIndex>(cfg.index);
    index->enroll("alice", unit_vector(DIM, 0));

    return std::make_unique<FacePipeline>(cfg, std::move(detector),
                                          std::make_shared<FakeEmbedder>(unit_vector(DIM, 0)),
                                          nullptr, index, "worker-test");
}

// Registro thread-safe de resultados entregados
class ResultLog {
public:
    ResultCallback callback(int tag) {
        return [this, tag](const FrameResult& result) {
            std::lock_guard<std::mutex> lock(mutex);
            entries.push_back({tag, result});
        };
    }

    struct Entry {
        int tag;
        FrameResult result;
    };

    std::vector<Entry> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return entries;
    }

    const FrameResult* find(int tag) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& e : entries) {
            if (e.tag == tag) return &e.result;
        }
        return nullptr;
    }

private:
    std::mutex mutex;
    std::vector<Entry> entries;
};

}  // namespace

TEST(StreamWorker, RequiresPipeline) {
    EXPECT_THROW(StreamWorker(nullptr), std::invalid_argument);
}

TEST(StreamWorker, SubmitBeforeStartIsRejected) {
    StreamWorker worker(make_pipeline(std::make_shared<ScriptedDetector>(steady_face(FACE))));
    bool called = false;

    SubmitStatus status = worker.submit(blank_frame(), [&called](const FrameResult&) {
        called = true;
    });

    EXPECT_EQ(status, SubmitStatus::Rejected);
    EXPECT_FALSE(called);
    EXPECT_EQ(worker.get_stats().rejected, 1u);
}

TEST(StreamWorker, ProcessesFramesInOrder) {
    StreamWorker worker(make_pipeline(std::make_shared<ScriptedDetector>(steady_face(FACE))));
    ResultLog log;
    worker.start();

    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(worker.submit(blank_frame(), log.callback(i)), SubmitStatus::Accepted);
        ASSERT_TRUE(worker.wait_idle(5000));
    }

    auto entries = log.snapshot();
    ASSERT_EQ(entries.size(), 5u);
    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(entries[i].tag, i);
        EXPECT_EQ(entries[i].result.status, FrameStatus::Processed);
        EXPECT_EQ(entries[i].result.frame_index, i);
    }
    EXPECT_EQ(entries[4].result.tracks.size(), 1u);

    worker.stop();
    EXPECT_EQ(worker.get_stats().processed, 5u);
}

TEST(StreamWorker, NewerFrameReplacesPending) {
    auto gate = std::make_shared<GateDetector>();
    StreamWorker worker(make_pipeline(gate));
    ResultLog log;
    worker.start();

    EXPECT_EQ(worker.submit(blank_frame(), log.callback(1)), SubmitStatus::Accepted);
    gate->wait_entered(1);

    EXPECT_EQ(worker.submit(blank_frame(), log.callback(2)), SubmitStatus::Accepted);
    EXPECT_EQ(worker.submit(blank_frame(), log.callback(3)), SubmitStatus::Replaced);

    // El reemplazado recibe Skipped de inmediato
    const FrameResult* skipped = log.find(2);
    ASSERT_NE(skipped, nullptr);
    EXPECT_EQ(skipped->status, FrameStatus::Skipped);

    gate->release();
    ASSERT_TRUE(worker.wait_idle(5000));

    auto entries = log.snapshot();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].tag, 2);
    EXPECT_EQ(entries[1].tag, 1);
    EXPECT_EQ(entries[1].result.status, FrameStatus::Processed);
    EXPECT_EQ(entries[1].result.frame_index, 0);
    EXPECT_EQ(entries[2].tag, 3);
    EXPECT_EQ(entries[2].result.status, FrameStatus::Processed);
    EXPECT_EQ(entries[2].result.frame_index, 1);

    WorkerStats stats = worker.get_stats();
    EXPECT_EQ(stats.submitted, 3u);
    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_EQ(stats.processed, 2u);
}

TEST(StreamWorker, StopCancelsPendingAndInFlight) {
    auto gate = std::make_shared<GateDetector>();
    StreamWorker worker(make_pipeline(gate));
    ResultLog log;

    std::promise<void> pending_cancelled;
    auto pending_future = pending_cancelled.get_future();

    worker.start();
    worker.submit(blank_frame(), log.callback(1));
    gate->wait_entered(1);

    worker.submit(blank_frame(), [&log, &pending_cancelled](const FrameResult& result) {
        log.callback(2)(result);
        pending_cancelled.set_value();
    });

    std::thread stopper([&worker] { worker.stop(); });

    // stop() entrega Cancelled al pendiente antes de esperar al hilo
    ASSERT_EQ(pending_future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    gate->release();
    stopper.join();

    const FrameResult* pending = log.find(2);
    ASSERT_NE(pending, nullptr);
    EXPECT_EQ(pending->status, FrameStatus::Cancelled);

    // El frame en proceso ve la cancelación después de detectar, antes del commit
    const FrameResult* in_flight = log.find(1);
    ASSERT_NE(in_flight, nullptr);
    EXPECT_EQ(in_flight->status, FrameStatus::Cancelled);
    EXPECT_EQ(worker.get_pipeline().get_tracker().size(), 0u);

    EXPECT_FALSE(worker.is_running());
    EXPECT_EQ(worker.submit(blank_frame(), log.callback(3)), SubmitStatus::Rejected);
}

TEST(StreamWorker, CallbackExceptionsDoNotStopTheStream) {
    StreamWorker worker(make_pipeline(std::make_shared<ScriptedDetector>(steady_face(FACE))));
    ResultLog log;
    worker.start();

    worker.submit(blank_frame(), [](const FrameResult&) {
        throw std::runtime_error("consumer failed");
    });
    ASSERT_TRUE(worker.wait_idle(5000));

    worker.submit(blank_frame(), log.callback(2));
    ASSERT_TRUE(worker.wait_idle(5000));

    const FrameResult* next = log.find(2);
    ASSERT_NE(next, nullptr);
    EXPECT_EQ(next->status, FrameStatus::Processed);
    EXPECT_EQ(worker.get_stats().callback_errors, 1u);
    EXPECT_TRUE(worker.is_running());
}

TEST(StreamWorker, EmptyFrameRejectedStreamContinues) {
    StreamWorker worker(make_pipeline(std::make_shared<ScriptedDetector>(steady_face(FACE))));
    ResultLog log;
    worker.start();

    worker.submit(cv::Mat(), log.callback(1));
    ASSERT_TRUE(worker.wait_idle(5000));
    worker.submit(blank_frame(), log.callback(2));
    ASSERT_TRUE(worker.wait_idle(5000));

    EXPECT_EQ(log.find(1)->status, FrameStatus::Rejected);
    EXPECT_EQ(log.find(2)->status, FrameStatus::Processed);
    EXPECT_EQ(worker.get_stats().rejected, 1u);
}

TEST(StreamWorker, CanRestartAfterStop) {
    StreamWorker worker(make_pipeline(std::make_shared<ScriptedDetector>(steady_face(FACE))));
    ResultLog log;

    worker.start();
    worker.stop();
    worker.start();

    EXPECT_EQ(worker.submit(blank_frame(), log.callback(1)), SubmitStatus::Accepted);
    ASSERT_TRUE(worker.wait_idle(5000));
    EXPECT_EQ(log.find(1)->status, FrameStatus::Processed);
}
