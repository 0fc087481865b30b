module;
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

module Core:Tasks.Impl;
import :Tasks;
import :Logging;

namespace Core::Tasks
{
    LocalTask::~LocalTask()
    {
        if (m_VTable) std::destroy_at(m_VTable);
    }

    LocalTask::LocalTask(LocalTask&& other) noexcept
    {
        if (other.m_VTable)
        {
            other.m_VTable->MoveTo(m_Storage);
            m_VTable = reinterpret_cast<Concept*>(m_Storage);
            std::destroy_at(other.m_VTable);
            other.m_VTable = nullptr;
        }
    }

    LocalTask& LocalTask::operator=(LocalTask&& other) noexcept
    {
        if (this != &other)
        {
            if (m_VTable) std::destroy_at(m_VTable);
            m_VTable = nullptr;

            if (other.m_VTable)
            {
                other.m_VTable->MoveTo(m_Storage);
                m_VTable = reinterpret_cast<Concept*>(m_Storage);
                std::destroy_at(other.m_VTable);
                other.m_VTable = nullptr;
            }
        }
        return *this;
    }

    void LocalTask::operator()()
    {
        if (m_VTable) m_VTable->Execute();
    }

    namespace
    {
        struct SchedulerContext
        {
            std::vector<std::thread> Workers;
            std::deque<LocalTask> Queue;

            std::mutex QueueMutex;
            std::condition_variable WakeCondition;

            bool IsRunning = false;

            // WaitForAll parks on ActiveTaskCount with std::atomic::wait.
            std::atomic<int> ActiveTaskCount{0};
            std::atomic<int> QueuedTaskCount{0};
        };

        std::unique_ptr<SchedulerContext> s_Ctx = nullptr;

        void FinishTask()
        {
            s_Ctx->ActiveTaskCount.fetch_sub(1, std::memory_order_release);
            s_Ctx->ActiveTaskCount.notify_all();
        }
    }

    void Scheduler::Initialize(unsigned threadCount)
    {
        if (s_Ctx) return;
        s_Ctx = std::make_unique<SchedulerContext>();
        s_Ctx->IsRunning = true;

        if (threadCount == 0)
        {
            threadCount = std::thread::hardware_concurrency();
            if (threadCount > 2) threadCount--; // Leave a core for the frame loop
            if (threadCount == 0) threadCount = 1;
        }

        Log::Info("Initializing Scheduler with {} worker threads.", threadCount);

        for (unsigned i = 0; i < threadCount; ++i)
        {
            s_Ctx->Workers.emplace_back([i] { WorkerEntry(i); });
        }
    }

    void Scheduler::Shutdown()
    {
        if (!s_Ctx) return;

        {
            std::lock_guard lock(s_Ctx->QueueMutex);
            s_Ctx->IsRunning = false;
        }
        s_Ctx->WakeCondition.notify_all();

        // Workers drain the remaining queue before exiting.
        for (auto& t : s_Ctx->Workers)
        {
            if (t.joinable()) t.join();
        }
        s_Ctx.reset();
    }

    bool Scheduler::IsRunning()
    {
        return s_Ctx != nullptr;
    }

    unsigned Scheduler::WorkerCount()
    {
        return s_Ctx ? static_cast<unsigned>(s_Ctx->Workers.size()) : 0u;
    }

    void Scheduler::DispatchInternal(LocalTask&& task)
    {
        if (!s_Ctx)
        {
            task();
            return;
        }

        s_Ctx->ActiveTaskCount.fetch_add(1, std::memory_order_relaxed);
        s_Ctx->QueuedTaskCount.fetch_add(1, std::memory_order_release);

        {
            std::lock_guard lock(s_Ctx->QueueMutex);
            s_Ctx->Queue.emplace_back(std::move(task));
        }
        s_Ctx->WakeCondition.notify_one();
    }

    void Scheduler::WaitForAll()
    {
        if (!s_Ctx) return;

        while (s_Ctx->QueuedTaskCount.load(std::memory_order_acquire) > 0)
        {
            LocalTask task;
            {
                std::unique_lock lock(s_Ctx->QueueMutex);
                if (!s_Ctx->Queue.empty())
                {
                    task = std::move(s_Ctx->Queue.front());
                    s_Ctx->Queue.pop_front();
                    s_Ctx->QueuedTaskCount.fetch_sub(1, std::memory_order_relaxed);
                }
            }

            if (task.Valid())
            {
                task();
                FinishTask();
            }
            else
            {
                std::this_thread::yield();
            }
        }

        int active = s_Ctx->ActiveTaskCount.load(std::memory_order_acquire);
        while (active > 0)
        {
            s_Ctx->ActiveTaskCount.wait(active);
            active = s_Ctx->ActiveTaskCount.load(std::memory_order_acquire);
        }
    }

    void Scheduler::WorkerEntry(unsigned)
    {
        while (true)
        {
            LocalTask task;
            {
                std::unique_lock lock(s_Ctx->QueueMutex);
                s_Ctx->WakeCondition.wait(lock, []
                {
                    return !s_Ctx->Queue.empty() || !s_Ctx->IsRunning;
                });

                if (s_Ctx->Queue.empty())
                    return;

                task = std::move(s_Ctx->Queue.front());
                s_Ctx->Queue.pop_front();
                s_Ctx->QueuedTaskCount.fetch_sub(1, std::memory_order_relaxed);
            }

            if (task.Valid())
            {
                task();
                FinishTask();
            }
        }
    }
}
