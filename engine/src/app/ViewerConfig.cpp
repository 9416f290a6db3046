#include "mmdv/app/ViewerConfig.hpp"
#include "mmdv/core/cvar.hpp"

#include <format>

namespace mmdv::app
{
    namespace
    {
        AUTO_CVAR_STRING(asset_motion, "Body motion (.vmd)", "assets/gimme_gimme_motion.vmd", core::CVarFlags::save);
        AUTO_CVAR_STRING(asset_camera_motion, "Camera motion (.vmd)", "assets/GimmeGimmeC.vmd", core::CVarFlags::save);
        AUTO_CVAR_STRING(asset_model, "Character model (.pmx)", "assets/sour_miku_black.pmx", core::CVarFlags::save);
        AUTO_CVAR_STRING(asset_audio, "Music track", "assets/gimme_gimme.wav", core::CVarFlags::save);
        AUTO_CVAR_STRING(evaluation_mode, "Animation evaluation: serial | parallel", "parallel", core::CVarFlags::save);

        AUTO_CVAR_STRING(xr_locomotion, "VR locomotion: free | teleport", "free", core::CVarFlags::save);
        AUTO_CVAR_FLOAT(xr_move_sensitivity, "Right stick movement per axis unit", 0.1f, core::CVarFlags::save);
        AUTO_CVAR_FLOAT(xr_rotation_speed, "Left stick rotation in radians per axis unit", 0.05f, core::CVarFlags::save);
        AUTO_CVAR_FLOAT(xr_camera_height, "XR camera height on entry", 10.0f, core::CVarFlags::save);

        AUTO_CVAR_INT(r_shadow_map_size, "Shadow map resolution", 4096, core::CVarFlags::save);
        AUTO_CVAR_INT(r_samples, "MSAA samples of the post-process pipeline", 4, core::CVarFlags::save);
        AUTO_CVAR_BOOL(r_vsync, "Wait for vertical sync", true, core::CVarFlags::save);
        AUTO_CVAR_INT(window_width, "Window width", 1280, core::CVarFlags::save);
        AUTO_CVAR_INT(window_height, "Window height", 720, core::CVarFlags::save);
    }

    core::Result<ViewerSettings> readViewerSettings()
    {
        ViewerSettings settings;
        settings.motionPath = asset_motion.get();
        settings.cameraMotionPath = asset_camera_motion.get();
        settings.modelPath = asset_model.get();
        settings.audioPath = asset_audio.get();

        auto mode = runtime::parseEvaluationMode(evaluation_mode.get());
        if (!mode) {
            return core::Unexpected(mode.error());
        }
        settings.evaluationMode = *mode;

        auto locomotion = xr::parseLocomotionMode(xr_locomotion.get());
        if (!locomotion) {
            return core::Unexpected(locomotion.error());
        }
        settings.vr.locomotion = *locomotion;
        settings.vr.movementSensitivity = xr_move_sensitivity.get();
        settings.vr.rotationSpeed = xr_rotation_speed.get();
        settings.vr.cameraHeight = xr_camera_height.get();

        if (r_shadow_map_size.get() <= 0 || r_samples.get() <= 0) {
            return core::Unexpected(std::format("invalid render settings: shadow map {}, samples {}",
                                                r_shadow_map_size.get(), r_samples.get()));
        }
        if (window_width.get() <= 0 || window_height.get() <= 0) {
            return core::Unexpected(std::format("invalid window size {}x{}", window_width.get(), window_height.get()));
        }
        settings.shadowMapSize = static_cast<uint32_t>(r_shadow_map_size.get());
        settings.samples = static_cast<uint32_t>(r_samples.get());
        settings.vsync = r_vsync.get();
        settings.windowWidth = window_width.get();
        settings.windowHeight = window_height.get();
        return settings;
    }
}
