#include "mmdv/core/TaskSystem.hpp"
#include "mmdv/core/logger.hpp"

#include <thread>

namespace mmdv::core
{
    std::unique_ptr<enki::TaskScheduler> TaskSystem::s_scheduler;
    std::unique_ptr<enki::TaskScheduler> TaskSystem::s_ioScheduler;

    void TaskSystem::init()
    {
        init(Config{});
    }

    void TaskSystem::init(const Config& config)
    {
        if (s_scheduler)
        {
            return;
        }

        uint32_t threads = config.numThreads;
        if (threads == 0) {
            uint32_t cores = std::thread::hardware_concurrency();
            // Keep the main and audio threads free
            threads = cores > 2 ? cores - 2 : 2;
        }

        s_scheduler = std::make_unique<enki::TaskScheduler>();
        s_scheduler->Initialize(threads);

        uint32_t ioThreads = config.numIoThreads;
        if (ioThreads < kMinIoThreads) {
            Logger::warn("TaskSystem: {} I/O threads requested, raising to {}", ioThreads, kMinIoThreads);
            ioThreads = kMinIoThreads;
        }
        s_ioScheduler = std::make_unique<enki::TaskScheduler>();
        s_ioScheduler->Initialize(ioThreads);

        Logger::info("TaskSystem initialized: {} compute threads, {} I/O threads.",
                     s_scheduler->GetNumTaskThreads(),
                     s_ioScheduler->GetNumTaskThreads());
    }

    void TaskSystem::shutdown()
    {
        if (s_ioScheduler)
        {
            s_ioScheduler->WaitforAllAndShutdown();
            s_ioScheduler.reset();
        }
        if (s_scheduler)
        {
            s_scheduler->WaitforAllAndShutdown();
            s_scheduler.reset();
        }
    }

    bool TaskSystem::isInitialized()
    {
        return s_scheduler != nullptr;
    }

    enki::TaskScheduler& TaskSystem::scheduler()
    {
        return *s_scheduler;
    }

    enki::TaskScheduler& TaskSystem::ioScheduler()
    {
        return *s_ioScheduler;
    }
}
