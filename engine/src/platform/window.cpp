#include "mmdv/platform/window.hpp"
#include "mmdv/core/logger.hpp"
#include <cpptrace/cpptrace.hpp>

namespace mmdv::platform
{
    Window::Window(const std::string& title, int width, int height,
                   SDL_WindowFlags flags)
    {
        if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS))
        {
            throw cpptrace::runtime_error(std::string("SDL_Init failed: ") + SDL_GetError());
        }

        SDL_Window* rawWindow = SDL_CreateWindow(title.c_str(), width, height, flags);

        if (rawWindow == nullptr)
        {
            SDL_Quit();
            throw cpptrace::runtime_error(std::string("SDL_CreateWindow failed: ") +
                SDL_GetError());
        }

        m_window.reset(rawWindow);

        core::Logger::info("Window created: {}x{}", width, height);
    }

    Window::~Window()
    {
        m_window.reset();
        SDL_Quit();
    }

    void Window::processEvents(Input* input, const EventCallback& callback)
    {
        SDL_Event event;
        while (SDL_PollEvent(&event))
        {
            if (callback) {
                callback(event);
            }

            if (input != nullptr)
            {
                input->processEvent(event);
            }

            switch (event.type)
            {
            case SDL_EVENT_QUIT:
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                m_running = false;
                break;

            case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
                core::Logger::debug("Window resized to {}x{}", event.window.data1,
                                    event.window.data2);
                if (m_onResize) {
                    m_onResize(event.window.data1, event.window.data2);
                }
                break;

            case SDL_EVENT_WINDOW_MINIMIZED:
                core::Logger::debug("Window minimized");
                break;

            default:
                break;
            }
        }
    }

    void Window::setTitle(const std::string& title) const
    {
        SDL_SetWindowTitle(m_window.get(), title.c_str());
    }

    void Window::setSize(int width, int height) const
    {
        if (!SDL_SetWindowSize(m_window.get(), width, height)) {
            core::Logger::warn("SDL_SetWindowSize failed: {}", SDL_GetError());
        }
    }

    int Window::width() const noexcept
    {
        int width = 0;
        SDL_GetWindowSizeInPixels(m_window.get(), &width, nullptr);
        return width;
    }

    int Window::height() const noexcept
    {
        int height = 0;
        SDL_GetWindowSizeInPixels(m_window.get(), nullptr, &height);
        return height;
    }
}
