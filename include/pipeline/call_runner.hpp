// ============= include/pipeline/call_runner.hpp =============
/*
 * Call Runner - llamadas externas con timeout
 *
 * CARACTERÍSTICAS:
 * - Un solo worker: las llamadas a un mismo colaborador nunca se solapan
 * - run(f) espera hasta timeout_ms; si vence retorna nullopt y la llamada
 *   sigue en el worker (la siguiente se encola detrás)
 * - timeout_ms = 0 -> llamada inline en el hilo actual
 * - Las excepciones de f se propagan al llamador
 *
 * Las lambdas deben capturar por valor: pueden terminar después de que
 * run() haya retornado.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>

class CallRunner {
public:
    explicit CallRunner(int timeout_ms = 0);
    ~CallRunner();

    CallRunner(const CallRunner&) = delete;
    CallRunner& operator=(const CallRunner&) = delete;

    template<typename F>
    auto run(F f) -> std::optional<std::invoke_result_t<F>>;

    int get_timeout_ms() const { return timeout_ms; }
    size_t pending_calls() const;

    void stop();

private:
    int timeout_ms;

    std::thread worker;
    std::queue<std::function<void()>> calls;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop_flag = false;

    void worker_thread();
};

// ==================== IMPLEMENTATION ====================

template<typename F>
auto CallRunner::run(F f) -> std::optional<std::invoke_result_t<F>> {
    using return_type = std::invoke_result_t<F>;

    if (timeout_ms <= 0) {
        return f();
    }

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::move(f));
    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag) {
            throw std::runtime_error("CallRunner is stopped");
        }
        calls.push([task]() { (*task)(); });
    }
    condition.notify_one();

    if (result.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        return std::nullopt;
    }

    return result.get();
}
