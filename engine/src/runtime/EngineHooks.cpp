#include "mmdv/runtime/EngineHooks.hpp"
#include "mmdv/core/logger.hpp"

#include <memory>

namespace mmdv::runtime {

    bool initializeEngineHooks(EngineHooks& hooks)
    {
        if (hooks.initialized) {
            core::Logger::warn("Engine hooks already initialized, ignoring");
            return false;
        }

        hooks.skinning.sdefEnabled = true;
        if (!hooks.textureDecoders.registerDecoder(std::make_unique<assets::BmpTextureDecoder>())) {
            core::Logger::debug("BMP decoder was already registered");
        }

        hooks.initialized = true;
        core::Logger::info("Engine hooks initialized (SDEF on, {} texture decoder(s))", hooks.textureDecoders.size());
        return true;
    }

}
