#pragma once

#include "mmdv/assets/TextureDecoder.hpp"

namespace mmdv::runtime {

    struct SkinningFeatures {
        // Spherical deformation for SDEF-weighted vertices. When off they
        // are skinned as BDEF2.
        bool sdefEnabled = false;
    };

    // Process-wide switches that must be in place before any scene object
    // is created
    struct EngineHooks {
        SkinningFeatures skinning;
        assets::TextureDecoderRegistry textureDecoders;
        bool initialized = false;
    };

    // Enables SDEF and registers the BMP decoder. Returns false, with a
    // warning, when the hooks were already initialized.
    bool initializeEngineHooks(EngineHooks& hooks);

}
