#include "mmdv/app/Application.hpp"
#include "mmdv/core/TaskSystem.hpp"
#include "mmdv/core/cvar.hpp"
#include "mmdv/core/logger.hpp"

#include <algorithm>

namespace mmdv::app
{
    Application::Application(ApplicationConfig cfg)
        : m_config(std::move(cfg)),
          m_window(m_config.title, m_config.width, m_config.height, m_config.windowFlags),
          m_baseDir(resolveBasePath())
    {
        m_window.setResizeCallback([this](int width, int height) { onResize(width, height); });
    }

    Application::~Application()
    {
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        core::Logger::shutdown();
    }

    std::filesystem::path Application::resolveBasePath()
    {
        const char* base = SDL_GetBasePath();
        if (base != nullptr) {
            return std::filesystem::path(base);
        }
        return std::filesystem::current_path();
    }

    void Application::loadConfig() const
    {
        // Working directory first, then next to the executable
        std::filesystem::path path = m_config.configFile;
        if (!std::filesystem::exists(path) && std::filesystem::exists(m_baseDir / m_config.configFile)) {
            path = m_baseDir / m_config.configFile;
        }
        if (!std::filesystem::exists(path)) {
            core::Logger::info("No {} found, writing defaults", m_config.configFile.string());
            core::CVarSystem::saveToIni(m_config.configFile);
            return;
        }
        core::CVarSystem::loadFromIni(path);
    }

    int Application::run()
    {
        cpptrace::register_terminate_handler();

        try
        {
            Log::init("[%H:%M:%S] [%-8l] %v");
            Log::info("MMDV starting");

            core::TaskSystem::init();
            loadConfig();

            onInit();

            while (m_window.isRunning())
            {
                m_input.beginFrame();
                m_window.processEvents(&m_input, [this](const SDL_Event& e) { onEvent(e); });

                const float deltaTime = std::clamp(m_timer.deltaTime(), 0.0F, 0.1F);
                onUpdate(deltaTime);
                onRenderFrame(deltaTime);
            }

            onShutdown();
            core::TaskSystem::shutdown();
            return 0;
        }
        catch (const cpptrace::exception& e)
        {
            Log::critical("Unhandled cpptrace exception: {}", e.what());
            // Background loads may still reference objects owned by the subclass
            core::TaskSystem::shutdown();
            SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "MMDV - Fatal Error", e.message(), nullptr);
            e.trace().print();
            return 1;
        }
        catch (const std::exception& e)
        {
            Log::critical("Unhandled Exception: {}", e.what());
            core::TaskSystem::shutdown();
            SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "MMDV - Fatal Error", e.what(), nullptr);
            cpptrace::generate_trace().print();
            return 1;
        }
    }

    void Application::onInit() {}
    void Application::onUpdate(float dt) { (void)dt; }
    void Application::onEvent(const SDL_Event& event) { (void)event; }
    void Application::onRenderFrame(float dt) { (void)dt; }
    void Application::onResize(int width, int height) { (void)width; (void)height; }
    void Application::onShutdown() {}
}
