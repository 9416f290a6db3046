#include <doctest/doctest.h>
#include "mmdv/assets/FileSource.hpp"
#include "mmdv/assets/LoadProgress.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace mmdv::assets;

TEST_CASE("ProgressBoard formatting") {
    CHECK(ProgressBoard::formatLine("Loading model", 50, 200) == "Loading model... 50/200 (25%)");
    CHECK(ProgressBoard::formatLine("Loading motion", 0, 0) == "Loading motion... 0/0 (0%)");
    CHECK(ProgressBoard::formatLine("Loading motion", 7, 7) == "Loading motion... 7/7 (100%)");
}

TEST_CASE("ProgressBoard keeps one line per slot") {
    ProgressBoard board;
    std::vector<std::string> seen;
    board.setListener([&seen](const std::string& text) { seen.push_back(text); });

    CHECK(board.text().empty());

    SUBCASE("Lines follow slot order, not update order") {
        board.update(LoadSlot::Model, 10, 100);
        board.update(LoadSlot::Motion, 5, 10);
        CHECK(board.text() == "Loading motion... 5/10 (50%)\nLoading model... 10/100 (10%)");
        REQUIRE(seen.size() == 2);
        CHECK(seen[0] == "Loading model... 10/100 (10%)");
        CHECK(seen[1] == board.text());
    }

    SUBCASE("Later updates replace the slot's line") {
        board.update(LoadSlot::CameraMotion, 1, 4);
        board.update(LoadSlot::CameraMotion, 4, 4);
        CHECK(board.text() == "Loading camera motion... 4/4 (100%)");
    }

    SUBCASE("Out of range slot is ignored") {
        board.update(7, "Loading extra", 1, 2);
        CHECK(board.text().empty());
        CHECK(seen.empty());
    }
}

TEST_CASE("ProgressBoard listener detach") {
    ProgressBoard board;

    SUBCASE("A cleared listener is not called again") {
        int calls = 0;
        board.setListener([&calls](const std::string&) { ++calls; });
        board.update(LoadSlot::Motion, 1, 2);
        board.setListener({});
        board.update(LoadSlot::Motion, 2, 2);
        CHECK(calls == 1);
        CHECK(board.text() == "Loading motion... 2/2 (100%)");
    }

    SUBCASE("Detaching waits for a listener call in progress") {
        std::promise<void> entered;
        std::promise<void> release;
        std::shared_future<void> released = release.get_future().share();
        std::atomic<bool> returned{false};
        board.setListener([&](const std::string&) {
            entered.set_value();
            released.wait();
            returned = true;
        });

        std::thread loader([&board] { board.update(LoadSlot::Model, 5, 10); });
        entered.get_future().wait();

        std::atomic<bool> detached{false};
        std::thread detacher([&board, &detached] {
            board.setListener({});
            detached = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        CHECK_FALSE(detached);
        release.set_value();
        detacher.join();
        CHECK(returned);
        loader.join();

        board.update(LoadSlot::Model, 10, 10);
        CHECK(board.text() == "Loading model... 10/10 (100%)");
    }
}

TEST_CASE("fetchFile reports chunked progress") {
    const auto path = std::filesystem::temp_directory_path() / "mmdv_fetch_test.bin";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        const char data[10] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
        out.write(data, sizeof(data));
    }

    SUBCASE("Progress is monotonic and ends at the file size") {
        std::vector<std::pair<uint64_t, uint64_t>> calls;
        auto bytes = fetchFile(path, [&calls](uint64_t loaded, uint64_t total) {
            calls.emplace_back(loaded, total);
        }, 4);

        REQUIRE(bytes.has_value());
        CHECK(bytes->size() == 10);
        CHECK((*bytes)[9] == 9);

        REQUIRE(calls.size() == 4);
        CHECK(calls[0].first == 0);
        CHECK(calls[1].first == 4);
        CHECK(calls[2].first == 8);
        CHECK(calls[3].first == 10);
        for (const auto& call : calls) {
            CHECK(call.second == 10);
        }
    }

    SUBCASE("Missing file") {
        auto bytes = fetchFile(path.parent_path() / "mmdv_missing_file.bin");
        CHECK_FALSE(bytes.has_value());
    }

    std::filesystem::remove(path);
}
