#pragma once

#include <cstdint>
#include <filesystem>

#include "mmdv/core/result.hpp"
#include "mmdv/runtime/EvaluationBackend.hpp"
#include "mmdv/xr/VrSessionManager.hpp"

namespace mmdv::app
{
    struct ViewerSettings
    {
        std::filesystem::path motionPath;
        std::filesystem::path cameraMotionPath;
        std::filesystem::path modelPath;
        std::filesystem::path audioPath;
        runtime::EvaluationMode evaluationMode = runtime::EvaluationMode::Parallel;
        xr::VrConfig vr;
        uint32_t shadowMapSize = 4096;
        uint32_t samples = 4;
        int windowWidth = 1280;
        int windowHeight = 720;
        bool vsync = true;
    };

    // Snapshot of the viewer CVars. Fails on an unknown locomotion or
    // evaluation mode, or on non-positive sizes.
    core::Result<ViewerSettings> readViewerSettings();
}
