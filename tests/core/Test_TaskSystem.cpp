#include <doctest/doctest.h>
#include "mmdv/assets/WhenAll.hpp"
#include "mmdv/core/TaskSystem.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <string>

using namespace mmdv;

TEST_CASE("TaskSystem keeps enough I/O workers for nested joins") {
    core::TaskSystem::shutdown();
    core::TaskSystem::init(core::TaskSystem::Config{.numThreads = 2, .numIoThreads = 1});
    REQUIRE(core::TaskSystem::isInitialized());

    CHECK(core::TaskSystem::ioScheduler().GetNumTaskThreads() == core::TaskSystem::kMinIoThreads);

    SUBCASE("A join inside an I/O task completes") {
        auto joined = std::make_shared<std::promise<std::string>>();
        std::future<std::string> done = joined->get_future();

        core::TaskSystem::launchIo([joined]() {
            auto result = assets::whenAll(
                []() -> core::Result<int> { return 3; },
                []() -> core::Result<std::string> { return std::string("camera"); });
            if (!result) {
                joined->set_value(result.error());
                return;
            }
            joined->set_value(std::get<1>(*result) + std::to_string(std::get<0>(*result)));
        });

        REQUIRE(done.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        CHECK(done.get() == "camera3");
    }

    core::TaskSystem::shutdown();
    core::TaskSystem::init();
}
