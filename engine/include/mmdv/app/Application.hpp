#pragma once

#include <filesystem>
#include <string>

#include <SDL3/SDL.h>
#include <cpptrace/cpptrace.hpp>

#include "mmdv/core/Timer.h"
#include "mmdv/platform/window.hpp"

namespace mmdv::app
{
    struct ApplicationConfig
    {
        std::string title{"MMDV"};
        int width{1280};
        int height{720};
        SDL_WindowFlags windowFlags{SDL_WINDOW_RESIZABLE};
        std::filesystem::path configFile{"mmdv.ini"};
    };

    // Window, event pump and frame loop. Subclasses hook in through the
    // virtual callbacks; exceptions escaping them end run() with code 1.
    class Application
    {
    public:
        explicit Application(ApplicationConfig cfg);
        virtual ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;

        int run();

    protected:
        virtual void onInit();
        virtual void onUpdate(float dt);
        virtual void onEvent(const SDL_Event& event);
        virtual void onRenderFrame(float dt);
        virtual void onResize(int width, int height);
        virtual void onShutdown();

        void loadConfig() const;

        [[nodiscard]] const std::filesystem::path& baseDir() const { return m_baseDir; }
        static std::filesystem::path resolveBasePath();

        ApplicationConfig m_config;
        platform::Window m_window;
        platform::Input m_input;
        core::Timer m_timer;
        std::filesystem::path m_baseDir;
    };
}
