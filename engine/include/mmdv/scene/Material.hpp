#pragma once
#include <glm/glm.hpp>
#include <cstdint>
#include <string>

namespace mmdv::scene {

    struct DirectionalLight;

    enum class MaterialType : uint8_t {
        MmdStandard,
        // Transparent except where shadows fall
        ShadowOnly
    };

    struct Material
    {
        std::string name;
        MaterialType type = MaterialType::MmdStandard;
        glm::vec4 diffuse{1.0f};
        glm::vec3 specular{0.0f};
        float specularPower = 0.0f;
        glm::vec3 ambient{0.0f};
        float alpha = 1.0f;
        int32_t textureIndex = -1;
        bool doubleSided = false;
        const DirectionalLight* activeLight = nullptr;
        bool frozen = false;
    };

}
