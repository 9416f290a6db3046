#pragma once

#include <SDL3/SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "Input.hpp"

namespace mmdv::platform {

class Window {
public:

  explicit Window(const std::string &title = "MMDV", int width = 1280,
                  int height = 720, SDL_WindowFlags flags = SDL_WINDOW_RESIZABLE);

  ~Window();

  Window(const Window &) = delete;
  Window &operator=(const Window &) = delete;

  Window(Window &&) = default;
  Window &operator=(Window &&) = default;

  [[nodiscard]] SDL_Window *get() const noexcept { return m_window.get(); }
  [[nodiscard]] operator SDL_Window *() const noexcept {
    return m_window.get();
  }

  using EventCallback = std::function<void(const SDL_Event&)>;
  using ResizeCallback = std::function<void(int, int)>;

  void processEvents(Input* input = nullptr, const EventCallback& callback = nullptr);

  void setResizeCallback(ResizeCallback callback) { m_onResize = std::move(callback); }

  [[nodiscard]] bool isRunning() const noexcept { return m_running; }
  void requestClose() noexcept { m_running = false; }

  void setTitle(const std::string &title) const;
  void setSize(int width, int height) const;
  [[nodiscard]] int width() const noexcept;
  [[nodiscard]] int height() const noexcept;

private:

  struct SDLWindowDeleter {
    void operator()(SDL_Window *window) const noexcept {
      if (window) {
        SDL_DestroyWindow(window);
      }
    }
  };

  std::unique_ptr<SDL_Window, SDLWindowDeleter> m_window;
  ResizeCallback m_onResize;
  bool m_running = true;
};

}
