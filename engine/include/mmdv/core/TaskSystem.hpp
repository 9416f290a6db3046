#pragma once

#include <TaskScheduler.h>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>

namespace mmdv::core
{
    template<typename Func>
    class ScopedTask : public enki::ITaskSet {
    public:
        explicit ScopedTask(Func&& func)
            : m_func(std::forward<Func>(func)) {}

        void ExecuteRange(enki::TaskSetPartition range, uint32_t threadnum) override {
            m_func(range, threadnum);
        }

    private:
        Func m_func;
    };

    // Deletes its dependency task once that task has fully completed
    struct CompletionActionDelete : enki::ICompletable {
        enki::Dependency m_dependency;

        void OnDependenciesComplete(enki::TaskScheduler* scheduler, uint32_t threadNum) override {
            enki::ICompletable::OnDependenciesComplete(scheduler, threadNum);
            // Deletes the owning task, and with it this object. Must stay last.
            delete m_dependency.GetDependencyTask();
        }
    };

    // Heap-allocated one-shot task for fire-and-forget work on the I/O pool
    template<typename Func>
    class DetachedTask : public enki::ITaskSet {
    public:
        explicit DetachedTask(Func func)
            : m_func(std::move(func)) {
            m_deleter.SetDependency(m_deleter.m_dependency, this);
        }

        void ExecuteRange(enki::TaskSetPartition, uint32_t) override {
            m_func();
        }

    private:
        Func m_func;
        CompletionActionDelete m_deleter;
    };

    class TaskSystem
    {
    public:
        struct Config
        {
            uint32_t numThreads = 0; // 0 = hardware_concurrency() - 2
            uint32_t numIoThreads = 4;
        };

        // An I/O task may block joining sibling I/O tasks (whenAll inside a
        // launchIo job), so the pool keeps at least two workers besides the
        // thread that owns the scheduler
        static constexpr uint32_t kMinIoThreads = 3;

        static void init();
        static void init(const Config& config);
        static void shutdown();
        static bool isInitialized();
        static enki::TaskScheduler& scheduler();
        static enki::TaskScheduler& ioScheduler();

        // Runs func once on the I/O pool. Without an initialized pool the
        // call runs synchronously on the caller's thread.
        template<typename Func>
        static void launchIo(Func&& func) {
            if (!s_ioScheduler) {
                func();
                return;
            }
            auto* task = new DetachedTask<std::decay_t<Func>>(std::forward<Func>(func));
            s_ioScheduler->AddTaskSetToPipe(task);
        }

        template<typename Func>
        static void parallelFor(uint32_t setSize, Func&& func, uint32_t minRange = 1) {
            if (setSize == 0) {
                return;
            }
            if (!s_scheduler) {
                enki::TaskSetPartition range{0, setSize};
                func(range, 0);
                return;
            }

            ScopedTask<Func> task(std::forward<Func>(func));
            task.m_SetSize = setSize;
            task.m_MinRange = minRange;
            scheduler().AddTaskSetToPipe(&task);
            scheduler().WaitforTask(&task);
        }

    private:
        static std::unique_ptr<enki::TaskScheduler> s_scheduler;
        static std::unique_ptr<enki::TaskScheduler> s_ioScheduler;
    };
}
