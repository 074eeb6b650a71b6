#include "pt_api/core/threadPool.hpp"
#include "pt_api/core/debug.hpp"

#include <chrono>

namespace pt_api {

    ThreadPool::ThreadPool(size_t threadCount)
        : m_queues(threadCount == 0 ? 1 : threadCount),
          m_mutexes(threadCount == 0 ? 1 : threadCount),
          m_conditions(threadCount == 0 ? 1 : threadCount),
          m_running(true)
    {
        const size_t count = m_queues.size();
        m_workers.reserve(count);
        for (size_t i = 0; i < count; ++i)
            m_workers.emplace_back(&ThreadPool::WorkerLoop, this, i);

        PT_LOG_DEBUG("ThreadPool started with {} workers.", count);
    }

    ThreadPool::~ThreadPool() {
        Shutdown();
    }

    void ThreadPool::Shutdown() {
        if (!m_running.exchange(false, std::memory_order_acq_rel))
            return;

        for (size_t i = 0; i < m_conditions.size(); ++i) {
            // o lock garante que nenhum worker perca a notificação entre o teste e o wait
            std::lock_guard<std::mutex> lock(m_mutexes[i]);
            m_conditions[i].notify_all();
        }

        for (auto& worker : m_workers) {
            if (worker.joinable())
                worker.join();
        }

        PT_LOG_DEBUG("ThreadPool shut down.");
    }

    bool ThreadPool::tryPop(size_t index, std::function<void()>& task) {
        std::lock_guard<std::mutex> lock(m_mutexes[index]);
        if (m_queues[index].empty())
            return false;

        task = std::move(m_queues[index].front());
        m_queues[index].pop_front();
        m_pending.fetch_sub(1, std::memory_order_acq_rel);
        return true;
    }

    bool ThreadPool::trySteal(size_t thief, std::function<void()>& task) {
        const size_t count = m_queues.size();
        for (size_t offset = 1; offset < count; ++offset) {
            const size_t victim = (thief + offset) % count;
            std::unique_lock<std::mutex> lock(m_mutexes[victim], std::try_to_lock);
            if (!lock.owns_lock() || m_queues[victim].empty())
                continue;

            // rouba do fim para não competir com o dono da fila
            task = std::move(m_queues[victim].back());
            m_queues[victim].pop_back();
            m_pending.fetch_sub(1, std::memory_order_acq_rel);
            return true;
        }
        return false;
    }

    void ThreadPool::WorkerLoop(size_t index) {
        using namespace std::chrono_literals;

        while (true) {
            std::function<void()> task;
            if (tryPop(index, task) || trySteal(index, task)) {
                task();
                continue;
            }

            std::unique_lock<std::mutex> lock(m_mutexes[index]);
            if (!m_running.load(std::memory_order_acquire) && m_pending.load(std::memory_order_acquire) == 0)
                break;

            // acorda periodicamente para tentar roubar de outras filas
            m_conditions[index].wait_for(lock, 2ms, [this, index] {
                return !m_queues[index].empty() || !m_running.load(std::memory_order_acquire);
            });
        }
    }

} // namespace pt_api
