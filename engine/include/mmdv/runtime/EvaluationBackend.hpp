#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "mmdv/core/TaskSystem.hpp"
#include "mmdv/core/result.hpp"

namespace mmdv::runtime {

    enum class EvaluationMode : uint8_t {
        Serial,
        Parallel
    };

    core::Result<EvaluationMode> parseEvaluationMode(const std::string& text);

    // Executes per-bone animation work, either inline or fanned out over the
    // core task scheduler.
    class EvaluationBackend {
    public:
        // Parallel mode requires an initialized TaskSystem
        static core::Result<std::shared_ptr<EvaluationBackend>> create(EvaluationMode mode);

        [[nodiscard]] EvaluationMode mode() const { return m_mode; }

        // Calls func(i) for every i in [0, count)
        template <typename Func>
        void forEach(uint32_t count, Func&& func) const {
            if (m_mode == EvaluationMode::Serial || count < kParallelThreshold) {
                for (uint32_t i = 0; i < count; ++i) {
                    func(i);
                }
                return;
            }
            core::TaskSystem::parallelFor(count, [&func](enki::TaskSetPartition range, uint32_t) {
                for (uint32_t i = range.start; i < range.end; ++i) {
                    func(i);
                }
            }, kParallelThreshold / 2);
        }

    private:
        explicit EvaluationBackend(EvaluationMode mode) : m_mode(mode) {}

        static constexpr uint32_t kParallelThreshold = 64;

        EvaluationMode m_mode;
    };

}
