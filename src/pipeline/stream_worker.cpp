// ============= src/pipeline/stream_worker.cpp =============
#include "pipeline/stream_worker.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

StreamWorker::StreamWorker(std::unique_ptr<FacePipeline> pipeline)
    : pipeline(std::move(pipeline))
{
    if (!this->pipeline) {
        throw std::invalid_argument("StreamWorker requires a pipeline");
    }
}

StreamWorker::~StreamWorker() {
    stop();
}

FrameResult StreamWorker::unprocessed(FrameStatus status) {
    FrameResult result;
    result.status = status;
    return result;
}

// ==================== CONTROL ====================

void StreamWorker::start() {
    std::lock_guard<std::mutex> lock(mutex);
    if (running) return;

    stop_flag = false;
    cancel_flag = false;
    failure = nullptr;
    running = true;
    worker = std::thread(&StreamWorker::worker_thread, this);

    spdlog::info("▶️  Stream worker [{}] started", pipeline->get_stream_id());
}

void StreamWorker::stop() {
    std::optional<PendingFrame> abandoned;

    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running && !worker.joinable()) return;

        stop_flag = true;
        cancel_flag = true;
        abandoned = std::move(pending);
        pending.reset();
        if (abandoned) stats.cancelled++;
    }
    condition.notify_all();

    if (abandoned) {
        deliver(abandoned->callback, unprocessed(FrameStatus::Cancelled));
    }

    if (worker.joinable()) {
        worker.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        running = false;
    }
    idle_condition.notify_all();

    spdlog::info("⏹️  Stream worker [{}] stopped", pipeline->get_stream_id());
}

bool StreamWorker::is_running() const {
    std::lock_guard<std::mutex> lock(mutex);
    return running && !stop_flag;
}

WorkerStats StreamWorker::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex);
    return stats;
}

void StreamWorker::rethrow_failure() {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(mutex);
        error = failure;
        failure = nullptr;
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

// ==================== SUBMIT ====================

SubmitStatus StreamWorker::submit(const cv::Mat& frame, ResultCallback callback) {
    rethrow_failure();

    std::optional<PendingFrame> replaced;
    SubmitStatus status;

    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running || stop_flag) {
            stats.rejected++;
            return SubmitStatus::Rejected;
        }

        stats.submitted++;
        if (pending) {
            replaced = std::move(pending);
            stats.skipped++;
            status = SubmitStatus::Replaced;
        } else {
            status = SubmitStatus::Accepted;
        }
        pending = PendingFrame{frame, std::move(callback)};
    }
    condition.notify_one();

    if (replaced) {
        spdlog::debug("[stream={}] frame replaced before processing", pipeline->get_stream_id());
        deliver(replaced->callback, unprocessed(FrameStatus::Skipped));
    }

    return status;
}

bool StreamWorker::wait_idle(int timeout_ms) {
    bool idle;
    {
        std::unique_lock<std::mutex> lock(mutex);
        auto is_idle = [this] { return (!pending && !in_flight) || !running; };

        if (timeout_ms < 0) {
            idle_condition.wait(lock, is_idle);
            idle = true;
        } else {
            idle = idle_condition.wait_for(lock, std::chrono::milliseconds(timeout_ms), is_idle);
        }
    }

    rethrow_failure();
    return idle;
}

// ==================== WORKER ====================

void StreamWorker::deliver(const ResultCallback& callback, const FrameResult& result) {
    if (!callback) return;

    try {
        callback(result);
    } catch (const std::exception& e) {
        spdlog::error("[stream={}] ❌ Result callback failed: {}",
                      pipeline->get_stream_id(), e.what());
        std::lock_guard<std::mutex> lock(mutex);
        stats.callback_errors++;
    }
}

void StreamWorker::worker_thread() {
    while (true) {
        PendingFrame job;

        {
            std::unique_lock<std::mutex> lock(mutex);
            condition.wait(lock, [this] {
                return stop_flag || pending.has_value();
            });

            if (stop_flag) {
                return;
            }

            job = std::move(*pending);
            pending.reset();
            in_flight = true;
        }

        FrameResult result;
        try {
            result = pipeline->process(job.frame, &cancel_flag);
        } catch (const std::logic_error& e) {
            spdlog::critical("[stream={}] 💥 Pipeline invariant violated: {}",
                             pipeline->get_stream_id(), e.what());
            std::optional<PendingFrame> abandoned;
            {
                std::lock_guard<std::mutex> lock(mutex);
                failure = std::current_exception();
                stop_flag = true;
                in_flight = false;
                stats.rejected++;
                abandoned = std::move(pending);
                pending.reset();
                if (abandoned) stats.cancelled++;
            }
            deliver(job.callback, unprocessed(FrameStatus::Rejected));
            if (abandoned) {
                deliver(abandoned->callback, unprocessed(FrameStatus::Cancelled));
            }
            idle_condition.notify_all();
            return;
        } catch (const std::exception& e) {
            spdlog::error("[stream={}] ❌ Frame processing failed: {}",
                          pipeline->get_stream_id(), e.what());
            result = unprocessed(FrameStatus::Rejected);
        }

        deliver(job.callback, result);

        {
            std::lock_guard<std::mutex> lock(mutex);
            in_flight = false;
            switch (result.status) {
                case FrameStatus::Processed: stats.processed++; break;
                case FrameStatus::Cancelled: stats.cancelled++; break;
                case FrameStatus::Rejected:  stats.rejected++; break;
                case FrameStatus::Skipped:   stats.skipped++; break;
            }
        }
        idle_condition.notify_all();
    }
}
