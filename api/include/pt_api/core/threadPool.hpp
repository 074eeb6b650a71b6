#pragma once

#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <atomic>
#include <memory>
#include <stdexcept>

namespace pt_api {

enum class TaskPriority { HIGH, NORMAL, LOW };

/**
 * @brief Pool de tamanho fixo com uma fila de tarefas por worker.
 *
 * Tarefas distribuídas em round-robin; workers ociosos roubam das outras filas.
 * Tarefas HIGH vão para o início da fila.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t threadCount = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<typename Func, typename... Args>
    auto Submit(TaskPriority priority, Func&& f, Args&&... args)
        -> std::future<decltype(f(args...))>;

    /// Executa as tarefas pendentes e aguarda os workers.
    void Shutdown();

    size_t GetThreadCount() const noexcept { return m_workers.size(); }

private:
    void WorkerLoop(size_t index);
    bool tryPop(size_t index, std::function<void()>& task);
    bool trySteal(size_t thief, std::function<void()>& task);

private:
    std::vector<std::deque<std::function<void()>>> m_queues;
    std::vector<std::mutex> m_mutexes;
    std::vector<std::condition_variable> m_conditions;
    std::vector<std::thread> m_workers;
    std::atomic_bool m_running;
    std::atomic_size_t m_pending{0};
    std::atomic_size_t m_nextQueue{0};
};

// ---------------- Template Implementation ----------------

template<typename Func, typename... Args>
auto ThreadPool::Submit(TaskPriority priority, Func&& f, Args&&... args)
    -> std::future<decltype(f(args...))>
{
    using ReturnType = decltype(f(args...));

    if (!m_running.load(std::memory_order_acquire))
        throw std::runtime_error("ThreadPool is shut down");

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<Func>(f), std::forward<Args>(args)...)
    );
    std::future<ReturnType> future = task->get_future();

    const size_t idx = m_nextQueue.fetch_add(1, std::memory_order_relaxed) % m_queues.size();
    {
        std::lock_guard<std::mutex> lock(m_mutexes[idx]);
        if(priority == TaskPriority::HIGH)
            m_queues[idx].emplace_front([task]{ (*task)(); });
        else
            m_queues[idx].emplace_back([task]{ (*task)(); });
        m_pending.fetch_add(1, std::memory_order_release);
    }

    m_conditions[idx].notify_one();
    return future;
}

} // namespace pt_api
