#include <doctest/doctest.h>
#include "mmdv/assets/WhenAll.hpp"

#include <atomic>
#include <future>
#include <stdexcept>
#include <string>

using namespace mmdv;

TEST_CASE("whenAll joins concurrent loads") {
    core::TaskSystem::init();

    SUBCASE("All tasks succeed") {
        auto result = assets::whenAll(
            []() -> core::Result<int> { return 7; },
            []() -> core::Result<std::string> { return std::string("model"); },
            []() -> core::Result<float> { return 0.5f; });

        REQUIRE(result.has_value());
        const auto& [number, text, ratio] = *result;
        CHECK(number == 7);
        CHECK(text == "model");
        CHECK(ratio == doctest::Approx(0.5f));
    }

    SUBCASE("First failure is returned while other tasks still run") {
        std::promise<void> gate;
        std::shared_future<void> opened = gate.get_future().share();
        auto finished = std::make_shared<std::atomic<bool>>(false);

        auto result = assets::whenAll(
            [opened, finished]() -> core::Result<int> {
                opened.wait();
                finished->store(true);
                return 1;
            },
            []() -> core::Result<int> { return core::Unexpected(std::string("VMD header: bad signature")); });

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == "VMD header: bad signature");
        CHECK_FALSE(finished->load());

        gate.set_value();
        core::TaskSystem::ioScheduler().WaitforAll();
        CHECK(finished->load());
    }

    SUBCASE("Exceptions become errors") {
        auto result = assets::whenAll(
            []() -> core::Result<int> { throw std::runtime_error("disk unplugged"); });
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == "disk unplugged");
    }
}
