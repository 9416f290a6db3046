#pragma once

#include <SDL3/SDL.h>
#include <array>

namespace mmdv::platform {

// Keyboard state for the viewer shortcuts. Tracks the current and previous
// frame so a held key reports one press.
class Input {
public:
  Input() = default;

  void beginFrame() {
    m_previous = m_keys;
  }

  void processEvent(const SDL_Event& event) {
    switch (event.type) {
      case SDL_EVENT_KEY_DOWN:
        if (event.key.scancode < m_keys.size()) {
          m_keys[event.key.scancode] = true;
        }
        break;

      case SDL_EVENT_KEY_UP:
        if (event.key.scancode < m_keys.size()) {
          m_keys[event.key.scancode] = false;
        }
        break;

      case SDL_EVENT_WINDOW_FOCUS_LOST:
        m_keys.fill(false);
        break;

      default:
        break;
    }
  }

  [[nodiscard]] bool isKeyDown(SDL_Scancode key) const {
    return key < m_keys.size() && m_keys[key];
  }

  [[nodiscard]] bool wasKeyPressed(SDL_Scancode key) const {
    return isKeyDown(key) && !m_previous[key];
  }

private:
  std::array<bool, SDL_SCANCODE_COUNT> m_keys{};
  std::array<bool, SDL_SCANCODE_COUNT> m_previous{};
};

}
