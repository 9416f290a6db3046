#pragma once

#include <optional>

#include "mmdv/core/Observable.hpp"
#include "mmdv/core/result.hpp"
#include "mmdv/xr/MotionController.hpp"
#include "mmdv/xr/XrTypes.hpp"

namespace mmdv::xr
{
    // Device side of an immersive session. Events are delivered on the
    // thread calling pollEvents().
    class XrRuntime
    {
    public:
        virtual ~XrRuntime() = default;

        [[nodiscard]] virtual const char* name() const = 0;

        // Negotiates the session. No observer fires on failure.
        virtual core::Result<void> requestSession(const SessionRequest& request) = 0;

        // Asks the device to end the session. onSessionEnded fires once the
        // runtime confirms, from a later pollEvents().
        virtual void requestExit() = 0;

        [[nodiscard]] virtual bool sessionActive() const = 0;
        virtual void pollEvents() = 0;
        [[nodiscard]] virtual std::optional<HeadPose> headPose() const = 0;

        core::Observable<XrInputSource&> onControllerAdded;
        core::Observable<> onSessionEnded;
    };
}
