#include <doctest/doctest.h>
#include "mmdv/platform/Input.hpp"

using namespace mmdv::platform;

namespace {

    SDL_Event keyEvent(SDL_EventType type, SDL_Scancode scancode) {
        SDL_Event event{};
        event.type = type;
        event.key.scancode = scancode;
        return event;
    }

}

TEST_CASE("Input reports one press per held key") {
    Input input;
    input.beginFrame();
    input.processEvent(keyEvent(SDL_EVENT_KEY_DOWN, SDL_SCANCODE_SPACE));

    CHECK(input.isKeyDown(SDL_SCANCODE_SPACE));
    CHECK(input.wasKeyPressed(SDL_SCANCODE_SPACE));
    CHECK_FALSE(input.wasKeyPressed(SDL_SCANCODE_ESCAPE));

    SUBCASE("Held across frames the key is down but not pressed again") {
        input.beginFrame();
        input.processEvent(keyEvent(SDL_EVENT_KEY_DOWN, SDL_SCANCODE_SPACE));
        CHECK(input.isKeyDown(SDL_SCANCODE_SPACE));
        CHECK_FALSE(input.wasKeyPressed(SDL_SCANCODE_SPACE));
    }

    SUBCASE("Release then press counts again") {
        input.beginFrame();
        input.processEvent(keyEvent(SDL_EVENT_KEY_UP, SDL_SCANCODE_SPACE));
        CHECK_FALSE(input.isKeyDown(SDL_SCANCODE_SPACE));

        input.beginFrame();
        input.processEvent(keyEvent(SDL_EVENT_KEY_DOWN, SDL_SCANCODE_SPACE));
        CHECK(input.wasKeyPressed(SDL_SCANCODE_SPACE));
    }

    SUBCASE("Losing focus releases every key") {
        input.processEvent(keyEvent(SDL_EVENT_KEY_DOWN, SDL_SCANCODE_ESCAPE));
        SDL_Event focus{};
        focus.type = SDL_EVENT_WINDOW_FOCUS_LOST;
        input.processEvent(focus);
        CHECK_FALSE(input.isKeyDown(SDL_SCANCODE_SPACE));
        CHECK_FALSE(input.isKeyDown(SDL_SCANCODE_ESCAPE));
    }
}

TEST_CASE("Input ignores scancodes outside the table") {
    Input input;
    const auto outside = static_cast<SDL_Scancode>(SDL_SCANCODE_COUNT + 3);
    input.processEvent(keyEvent(SDL_EVENT_KEY_DOWN, outside));
    CHECK_FALSE(input.isKeyDown(outside));
    CHECK_FALSE(input.wasKeyPressed(outside));
}
