// ============= src/pipeline/call_runner.cpp =============
#include "pipeline/call_runner.hpp"
#include <spdlog/spdlog.h>

CallRunner::CallRunner(int timeout_ms)
    : timeout_ms(timeout_ms)
{
    if (timeout_ms > 0) {
        worker = std::thread(&CallRunner::worker_thread, this);
    }
}

CallRunner::~CallRunner() {
    stop();
}

void CallRunner::worker_thread() {
    while (true) {
        std::function<void()> call;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);

            condition.wait(lock, [this] {
                return stop_flag || !calls.empty();
            });

            if (stop_flag && calls.empty()) {
                return;
            }

            call = std::move(calls.front());
            calls.pop();
        }

        // packaged_task guarda la excepción en el future
        call();
    }
}

size_t CallRunner::pending_calls() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return calls.size();
}

void CallRunner::stop() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag) return;
        stop_flag = true;
    }

    condition.notify_all();

    if (worker.joinable()) {
        if (pending_calls() > 0) {
            spdlog::debug("CallRunner stopping with {} queued calls", pending_calls());
        }
        worker.join();
    }
}
