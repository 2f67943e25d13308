// ============= test/fakes.hpp =============
// Colaboradores externos falsos para los tests (sin modelos)
#pragma once
#include "behavior/pose_estimator.hpp"
#include "detection/detector.hpp"
#include "recognition/embedding_extractor.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <vector>

// Detector con guion: script(n) da las detecciones de la llamada n
class ScriptedDetector : public FaceDetector {
public:
    using Script = std::function<std::vector<Detection>(int call)>;

    explicit ScriptedDetector(Script script) : script(std::move(script)) {}

    std::vector<Detection> detect(const cv::Mat&) override {
        return script(calls++);
    }

    std::atomic<int> calls{0};

private:
    Script script;
};

// Siempre la misma cara
inline ScriptedDetector::Script steady_face(const cv::Rect2f& box, float confidence = 0.9f,
                                            bool quality_ok = true) {
    return [box, confidence, quality_ok](int) {
        return std::vector<Detection>{Detection(box, confidence, quality_ok)};
    };
}

// Bloquea en detect() hasta release()
class GateDetector : public FaceDetector {
public:
    std::vector<Detection> detect(const cv::Mat&) override {
        std::unique_lock<std::mutex> lock(mutex);
        entered++;
        condition.notify_all();
        condition.wait(lock, [this] { return open; });
        return {};
    }

    void wait_entered(int n) {
        std::unique_lock<std::mutex> lock(mutex);
        condition.wait(lock, [this, n] { return entered >= n; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = true;
        }
        condition.notify_all();
    }

private:
    std::mutex mutex;
    std::condition_variable condition;
    int entered = 0;
    bool open = false;
};

class FakeEmbedder : public EmbeddingExtractor {
public:
    explicit FakeEmbedder(std::vector<float> output) : output(std::move(output)) {}

    std::vector<float> embed(const cv::Mat&, const cv::Rect2f&) override {
        int n = calls++;
        if (fail_from >= 0 && n >= fail_from) {
            throw std::runtime_error("embedder offline");
        }
        return output;
    }

    int get_embedding_size() const override { return static_cast<int>(output.size()); }

    std::atomic<int> calls{0};
    int fail_from = -1;     // a partir de esta llamada lanza

private:
    std::vector<float> output;
};

class FakePoseEstimator : public PoseEstimator {
public:
    explicit FakePoseEstimator(std::optional<HeadPose> pose) : pose(pose) {}

    std::optional<HeadPose> estimate(const cv::Mat&, const cv::Rect2f&) override {
        calls++;
        return pose;
    }

    std::atomic<int> calls{0};

private:
    std::optional<HeadPose> pose;
};

// Vector base canónico e_i de dimensión dim
inline std::vector<float> unit_vector(int dim, int axis, float scale = 1.0f) {
    std::vector<float> v(dim, 0.0f);
    v[axis] = scale;
    return v;
}
