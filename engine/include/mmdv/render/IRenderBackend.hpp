#pragma once

#include <cstdint>
#include <string>

namespace mmdv::scene { class Scene; }

namespace mmdv::render
{
    // Draws a prepared scene. Transforms and camera matrices are current
    // when drawScene is called.
    class IRenderBackend
    {
    public:
        virtual ~IRenderBackend() = default;

        virtual void resize(uint32_t width, uint32_t height) = 0;
        virtual void drawScene(const scene::Scene& scene) = 0;
        virtual void present() = 0;

        [[nodiscard]] virtual const char* name() const = 0;
    };

    // Records draw calls without touching a GPU. Used headless and in tests.
    class NullRenderBackend final : public IRenderBackend
    {
    public:
        void resize(uint32_t width, uint32_t height) override { m_width = width; m_height = height; }
        void drawScene(const scene::Scene&) override { ++m_drawCount; }
        void present() override { ++m_presentCount; }
        [[nodiscard]] const char* name() const override { return "Null"; }

        [[nodiscard]] uint64_t drawCount() const { return m_drawCount; }
        [[nodiscard]] uint64_t presentCount() const { return m_presentCount; }
        [[nodiscard]] uint32_t width() const { return m_width; }
        [[nodiscard]] uint32_t height() const { return m_height; }

    private:
        uint64_t m_drawCount = 0;
        uint64_t m_presentCount = 0;
        uint32_t m_width = 0;
        uint32_t m_height = 0;
    };
}
