#pragma once
#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mmdv::scene { class Camera; }

namespace mmdv::render
{
    struct PostProcessSettings {
        uint32_t samples = 1;
        bool fxaaEnabled = false;
        bool chromaticAberrationEnabled = false;
        bool bloomEnabled = false;
        bool imageProcessingEnabled = true;

        bool operator==(const PostProcessSettings&) const = default;
    };

    // Post-processing chain applied to the listed cameras
    class DefaultRenderingPipeline
    {
    public:
        DefaultRenderingPipeline(std::string name, bool hdr, std::vector<scene::Camera*> cameras)
            : m_name(std::move(name)), m_hdr(hdr), m_cameras(std::move(cameras)) {}

        void addCamera(scene::Camera* camera) {
            if (camera != nullptr && !hasCamera(camera)) {
                m_cameras.push_back(camera);
            }
        }

        void removeCamera(scene::Camera* camera) {
            std::erase(m_cameras, camera);
        }

        [[nodiscard]] bool hasCamera(const scene::Camera* camera) const {
            return std::find(m_cameras.begin(), m_cameras.end(), camera) != m_cameras.end();
        }

        [[nodiscard]] const std::string& name() const { return m_name; }
        [[nodiscard]] bool hdr() const { return m_hdr; }
        [[nodiscard]] const std::vector<scene::Camera*>& cameras() const { return m_cameras; }

        PostProcessSettings settings;

    private:
        std::string m_name;
        bool m_hdr;
        std::vector<scene::Camera*> m_cameras;
    };
}
