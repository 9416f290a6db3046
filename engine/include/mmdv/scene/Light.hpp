#pragma once
#include <glm/glm.hpp>
#include <string>

namespace mmdv::scene {

    struct DirectionalLight
    {
        std::string name;
        glm::vec3 direction{0.0f, -1.0f, 0.0f};
        glm::vec3 diffuse{1.0f};
        float intensity{1.0f};
        // Shadow frustum is fixed by the user instead of fitted every frame
        bool autoCalcShadowZBounds = true;
        bool autoUpdateExtends = true;
    };

}
