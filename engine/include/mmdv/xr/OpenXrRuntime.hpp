#pragma once

#include <openxr/openxr.h>
#include <array>
#include <memory>
#include <string>

#include "mmdv/xr/XrRuntime.hpp"

namespace mmdv::xr
{
    // OpenXR session without a graphics binding (XR_MND_headless): head
    // tracking and controller input only, frames are submitted empty.
    class OpenXrRuntime final : public XrRuntime
    {
    public:
        OpenXrRuntime() = default;
        ~OpenXrRuntime() override;

        OpenXrRuntime(const OpenXrRuntime&) = delete;
        OpenXrRuntime& operator=(const OpenXrRuntime&) = delete;

        [[nodiscard]] const char* name() const override { return "OpenXR"; }

        core::Result<void> requestSession(const SessionRequest& request) override;
        void requestExit() override;
        [[nodiscard]] bool sessionActive() const override { return m_session != XR_NULL_HANDLE; }
        void pollEvents() override;
        [[nodiscard]] std::optional<HeadPose> headPose() const override { return m_headPose; }

    private:
        struct Hand
        {
            XrPath path = XR_NULL_PATH;
            std::unique_ptr<XrInputSource> source;
        };

        void createInstance();
        void createSession(const SessionRequest& request);
        void createActions();
        void suggestBindings(const char* profile, const std::vector<std::pair<XrAction, std::string>>& bindings);
        void destroySession();
        void handleSessionStateChanged(const XrEventDataSessionStateChanged& changed);
        void runFrame();
        void syncInput();
        void addInputSources();
        XrPath toPath(const std::string& path) const;

        XrInstance m_instance = XR_NULL_HANDLE;
        XrSystemId m_systemId = XR_NULL_SYSTEM_ID;
        bool m_localFloorSupported = false;

        XrSession m_session = XR_NULL_HANDLE;
        XrSpace m_appSpace = XR_NULL_HANDLE;
        XrSpace m_viewSpace = XR_NULL_HANDLE;
        XrSessionState m_sessionState = XR_SESSION_STATE_UNKNOWN;
        bool m_running = false;

        XrActionSet m_actionSet = XR_NULL_HANDLE;
        XrAction m_triggerAction = XR_NULL_HANDLE;
        XrAction m_squeezeAction = XR_NULL_HANDLE;
        XrAction m_thumbstickAction = XR_NULL_HANDLE;
        XrAction m_primaryAction = XR_NULL_HANDLE;
        XrAction m_secondaryAction = XR_NULL_HANDLE;
        std::array<Hand, 2> m_hands;

        std::optional<HeadPose> m_headPose;
    };
}
