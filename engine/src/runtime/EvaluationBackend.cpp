#include "mmdv/runtime/EvaluationBackend.hpp"
#include "mmdv/core/logger.hpp"

#include <format>

namespace mmdv::runtime {

    core::Result<EvaluationMode> parseEvaluationMode(const std::string& text)
    {
        if (text == "serial") {
            return EvaluationMode::Serial;
        }
        if (text == "parallel") {
            return EvaluationMode::Parallel;
        }
        return core::Unexpected(std::format("unknown evaluation mode \"{}\" (serial | parallel)", text));
    }

    core::Result<std::shared_ptr<EvaluationBackend>> EvaluationBackend::create(EvaluationMode mode)
    {
        if (mode == EvaluationMode::Parallel && !core::TaskSystem::isInitialized()) {
            return core::Unexpected(std::string("parallel evaluation requested but the task system is not running"));
        }
        core::Logger::info("Animation evaluation backend: {}", mode == EvaluationMode::Parallel ? "parallel" : "serial");
        return std::shared_ptr<EvaluationBackend>(new EvaluationBackend(mode));
    }

}
