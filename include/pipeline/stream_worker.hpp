// ============= include/pipeline/stream_worker.hpp =============
/*
 * Stream Worker - un hilo por stream con backpressure
 *
 * CARACTERÍSTICAS:
 * - A lo sumo un frame en proceso y uno pendiente
 * - Un frame nuevo reemplaza al pendiente (gana el más reciente);
 *   el callback del reemplazado recibe FrameStatus::Skipped
 * - Resultados del mismo stream en orden de frame
 * - stop(): el pendiente recibe Cancelled y el frame en proceso ve la
 *   señal de cancelación entre etapas
 * - Excepciones del callback se registran y no detienen el stream
 * - Violación de invariantes del pipeline (logic_error): el worker se
 *   detiene y la excepción se relanza en el siguiente submit()/wait_idle()
 *
 * El transporte (framing) queda fuera: submit() + callback es el límite.
 */

#pragma once
#include "pipeline/face_pipeline.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

enum class SubmitStatus {
    Accepted,
    Replaced,     // había un frame pendiente, recibió Skipped
    Rejected      // worker detenido
};

using ResultCallback = std::function<void(const FrameResult&)>;

struct WorkerStats {
    uint64_t submitted = 0;
    uint64_t processed = 0;
    uint64_t skipped = 0;
    uint64_t cancelled = 0;
    uint64_t rejected = 0;
    uint64_t callback_errors = 0;
};

class StreamWorker {
public:
    explicit StreamWorker(std::unique_ptr<FacePipeline> pipeline);
    ~StreamWorker();

    StreamWorker(const StreamWorker&) = delete;
    StreamWorker& operator=(const StreamWorker&) = delete;

    void start();
    void stop();

    SubmitStatus submit(const cv::Mat& frame, ResultCallback callback);

    // Espera a que no haya frames pendientes ni en proceso.
    // timeout_ms < 0 -> sin límite. false si venció el timeout.
    bool wait_idle(int timeout_ms = -1);

    bool is_running() const;
    WorkerStats get_stats() const;

    const FacePipeline& get_pipeline() const { return *pipeline; }
    const std::string& get_stream_id() const { return pipeline->get_stream_id(); }

private:
    struct PendingFrame {
        cv::Mat frame;
        ResultCallback callback;
    };

    std::unique_ptr<FacePipeline> pipeline;

    std::thread worker;
    mutable std::mutex mutex;
    std::condition_variable condition;
    std::condition_variable idle_condition;

    std::optional<PendingFrame> pending;
    bool in_flight = false;
    bool running = false;
    bool stop_flag = false;
    std::atomic<bool> cancel_flag{false};
    std::exception_ptr failure;

    WorkerStats stats;

    void worker_thread();
    void deliver(const ResultCallback& callback, const FrameResult& result);
    void rethrow_failure();

    static FrameResult unprocessed(FrameStatus status);
};
