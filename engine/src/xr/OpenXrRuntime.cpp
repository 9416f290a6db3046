#include "mmdv/xr/OpenXrRuntime.hpp"
#include "mmdv/core/logger.hpp"

#include <cpptrace/cpptrace.hpp>
#include <algorithm>
#include <cstring>
#include <format>
#include <vector>

namespace mmdv::xr
{
    namespace
    {
        constexpr float kPressThreshold = 0.75f;
        constexpr float kReleaseThreshold = 0.65f;
        constexpr size_t kLeft = 0;
        constexpr size_t kRight = 1;

        std::string resultString(XrInstance instance, XrResult result)
        {
            if (instance != XR_NULL_HANDLE) {
                char buffer[XR_MAX_RESULT_STRING_SIZE];
                if (XR_SUCCEEDED(xrResultToString(instance, result, buffer))) {
                    return buffer;
                }
            }
            return std::to_string(static_cast<int32_t>(result));
        }

        void check(XrResult result, const char* call, XrInstance instance = XR_NULL_HANDLE)
        {
            if (XR_FAILED(result)) {
                throw cpptrace::runtime_error(std::format("{} failed: {}", call, resultString(instance, result)));
            }
        }

        bool hasExtension(const std::vector<XrExtensionProperties>& props, const char* name)
        {
            return std::any_of(props.begin(), props.end(),
                               [&](const XrExtensionProperties& p) { return std::strcmp(p.extensionName, name) == 0; });
        }

        // Hysteresis so analog triggers do not chatter around the threshold
        bool analogPressed(float value, bool wasPressed)
        {
            return wasPressed ? value >= kReleaseThreshold : value >= kPressThreshold;
        }
    }

    OpenXrRuntime::~OpenXrRuntime()
    {
        destroySession();
        if (m_actionSet != XR_NULL_HANDLE) {
            xrDestroyActionSet(m_actionSet);
        }
        if (m_instance != XR_NULL_HANDLE) {
            xrDestroyInstance(m_instance);
        }
    }

    XrPath OpenXrRuntime::toPath(const std::string& path) const
    {
        XrPath result = XR_NULL_PATH;
        check(xrStringToPath(m_instance, path.c_str(), &result), "xrStringToPath", m_instance);
        return result;
    }

    void OpenXrRuntime::createInstance()
    {
        uint32_t count = 0;
        check(xrEnumerateInstanceExtensionProperties(nullptr, 0, &count, nullptr),
              "xrEnumerateInstanceExtensionProperties(count)");
        std::vector<XrExtensionProperties> props(count, {XR_TYPE_EXTENSION_PROPERTIES});
        check(xrEnumerateInstanceExtensionProperties(nullptr, count, &count, props.data()),
              "xrEnumerateInstanceExtensionProperties(data)");

        if (!hasExtension(props, XR_MND_HEADLESS_EXTENSION_NAME)) {
            throw cpptrace::runtime_error(std::format("OpenXR runtime lacks {}", XR_MND_HEADLESS_EXTENSION_NAME));
        }
        std::vector<const char*> extensions{XR_MND_HEADLESS_EXTENSION_NAME};
        m_localFloorSupported = hasExtension(props, XR_EXT_LOCAL_FLOOR_EXTENSION_NAME);
        if (m_localFloorSupported) {
            extensions.push_back(XR_EXT_LOCAL_FLOOR_EXTENSION_NAME);
        }

        XrInstanceCreateInfo createInfo{XR_TYPE_INSTANCE_CREATE_INFO};
        std::strncpy(createInfo.applicationInfo.applicationName, "mmdv",
                     sizeof(createInfo.applicationInfo.applicationName) - 1);
        std::strncpy(createInfo.applicationInfo.engineName, "mmdv", sizeof(createInfo.applicationInfo.engineName) - 1);
        createInfo.applicationInfo.applicationVersion = 1;
        createInfo.applicationInfo.engineVersion = 1;
        createInfo.applicationInfo.apiVersion = XR_API_VERSION_1_0;
        createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
        createInfo.enabledExtensionNames = extensions.data();
        check(xrCreateInstance(&createInfo, &m_instance), "xrCreateInstance");

        XrInstanceProperties instanceProps{XR_TYPE_INSTANCE_PROPERTIES};
        check(xrGetInstanceProperties(m_instance, &instanceProps), "xrGetInstanceProperties", m_instance);
        core::Logger::info("OpenXR runtime: {}", instanceProps.runtimeName);

        XrSystemGetInfo systemInfo{XR_TYPE_SYSTEM_GET_INFO};
        systemInfo.formFactor = XR_FORM_FACTOR_HEAD_MOUNTED_DISPLAY;
        check(xrGetSystem(m_instance, &systemInfo, &m_systemId), "xrGetSystem", m_instance);

        createActions();
    }

    void OpenXrRuntime::createActions()
    {
        XrActionSetCreateInfo setInfo{XR_TYPE_ACTION_SET_CREATE_INFO};
        std::strncpy(setInfo.actionSetName, "viewer", sizeof(setInfo.actionSetName) - 1);
        std::strncpy(setInfo.localizedActionSetName, "Viewer", sizeof(setInfo.localizedActionSetName) - 1);
        check(xrCreateActionSet(m_instance, &setInfo, &m_actionSet), "xrCreateActionSet", m_instance);

        m_hands[kLeft].path = toPath("/user/hand/left");
        m_hands[kRight].path = toPath("/user/hand/right");
        const XrPath handPaths[] = {m_hands[kLeft].path, m_hands[kRight].path};

        auto makeAction = [&](const char* name, XrActionType type, XrAction& out) {
            XrActionCreateInfo info{XR_TYPE_ACTION_CREATE_INFO};
            info.actionType = type;
            std::strncpy(info.actionName, name, sizeof(info.actionName) - 1);
            std::strncpy(info.localizedActionName, name, sizeof(info.localizedActionName) - 1);
            info.countSubactionPaths = 2;
            info.subactionPaths = handPaths;
            check(xrCreateAction(m_actionSet, &info, &out), "xrCreateAction", m_instance);
        };
        makeAction("trigger", XR_ACTION_TYPE_FLOAT_INPUT, m_triggerAction);
        makeAction("squeeze", XR_ACTION_TYPE_FLOAT_INPUT, m_squeezeAction);
        makeAction("thumbstick", XR_ACTION_TYPE_VECTOR2F_INPUT, m_thumbstickAction);
        makeAction("primary", XR_ACTION_TYPE_BOOLEAN_INPUT, m_primaryAction);
        makeAction("secondary", XR_ACTION_TYPE_BOOLEAN_INPUT, m_secondaryAction);

        suggestBindings("/interaction_profiles/oculus/touch_controller", {
            {m_triggerAction, "/user/hand/left/input/trigger/value"},
            {m_triggerAction, "/user/hand/right/input/trigger/value"},
            {m_squeezeAction, "/user/hand/left/input/squeeze/value"},
            {m_squeezeAction, "/user/hand/right/input/squeeze/value"},
            {m_thumbstickAction, "/user/hand/left/input/thumbstick"},
            {m_thumbstickAction, "/user/hand/right/input/thumbstick"},
            {m_primaryAction, "/user/hand/left/input/x/click"},
            {m_primaryAction, "/user/hand/right/input/a/click"},
            {m_secondaryAction, "/user/hand/left/input/y/click"},
            {m_secondaryAction, "/user/hand/right/input/b/click"},
        });
        suggestBindings("/interaction_profiles/valve/index_controller", {
            {m_triggerAction, "/user/hand/left/input/trigger/value"},
            {m_triggerAction, "/user/hand/right/input/trigger/value"},
            {m_squeezeAction, "/user/hand/left/input/squeeze/value"},
            {m_squeezeAction, "/user/hand/right/input/squeeze/value"},
            {m_thumbstickAction, "/user/hand/left/input/thumbstick"},
            {m_thumbstickAction, "/user/hand/right/input/thumbstick"},
            {m_primaryAction, "/user/hand/left/input/a/click"},
            {m_primaryAction, "/user/hand/right/input/a/click"},
            {m_secondaryAction, "/user/hand/left/input/b/click"},
            {m_secondaryAction, "/user/hand/right/input/b/click"},
        });
        suggestBindings("/interaction_profiles/khr/simple_controller", {
            {m_triggerAction, "/user/hand/left/input/select/click"},
            {m_triggerAction, "/user/hand/right/input/select/click"},
            {m_primaryAction, "/user/hand/left/input/menu/click"},
            {m_primaryAction, "/user/hand/right/input/menu/click"},
        });
    }

    void OpenXrRuntime::suggestBindings(const char* profile,
                                        const std::vector<std::pair<XrAction, std::string>>& bindings)
    {
        std::vector<XrActionSuggestedBinding> suggested;
        suggested.reserve(bindings.size());
        for (const auto& [action, path] : bindings) {
            suggested.push_back({action, toPath(path)});
        }
        XrInteractionProfileSuggestedBinding info{XR_TYPE_INTERACTION_PROFILE_SUGGESTED_BINDING};
        info.interactionProfile = toPath(profile);
        info.suggestedBindings = suggested.data();
        info.countSuggestedBindings = static_cast<uint32_t>(suggested.size());
        const XrResult result = xrSuggestInteractionProfileBindings(m_instance, &info);
        if (XR_FAILED(result)) {
            core::Logger::warn("Bindings for {} rejected: {}", profile, resultString(m_instance, result));
        }
    }

    void OpenXrRuntime::createSession(const SessionRequest& request)
    {
        if (request.sessionMode != "immersive-vr") {
            throw cpptrace::runtime_error(std::format("unsupported session mode '{}'", request.sessionMode));
        }

        XrReferenceSpaceType spaceType = XR_REFERENCE_SPACE_TYPE_LOCAL;
        if (request.referenceSpace == "local-floor") {
            if (m_localFloorSupported) {
                spaceType = XR_REFERENCE_SPACE_TYPE_LOCAL_FLOOR_EXT;
            } else {
                core::Logger::warn("local-floor unavailable, using stage space");
                spaceType = XR_REFERENCE_SPACE_TYPE_STAGE;
            }
        } else if (request.referenceSpace == "bounded-floor") {
            spaceType = XR_REFERENCE_SPACE_TYPE_STAGE;
        } else if (request.referenceSpace != "local") {
            throw cpptrace::runtime_error(std::format("unsupported reference space '{}'", request.referenceSpace));
        }

        XrSessionCreateInfo sessionInfo{XR_TYPE_SESSION_CREATE_INFO};
        sessionInfo.systemId = m_systemId;
        check(xrCreateSession(m_instance, &sessionInfo, &m_session), "xrCreateSession", m_instance);

        XrReferenceSpaceCreateInfo spaceInfo{XR_TYPE_REFERENCE_SPACE_CREATE_INFO};
        spaceInfo.poseInReferenceSpace.orientation.w = 1.0f;
        spaceInfo.referenceSpaceType = spaceType;
        check(xrCreateReferenceSpace(m_session, &spaceInfo, &m_appSpace), "xrCreateReferenceSpace(app)", m_instance);
        spaceInfo.referenceSpaceType = XR_REFERENCE_SPACE_TYPE_VIEW;
        check(xrCreateReferenceSpace(m_session, &spaceInfo, &m_viewSpace), "xrCreateReferenceSpace(view)", m_instance);

        XrSessionActionSetsAttachInfo attachInfo{XR_TYPE_SESSION_ACTION_SETS_ATTACH_INFO};
        attachInfo.countActionSets = 1;
        attachInfo.actionSets = &m_actionSet;
        check(xrAttachSessionActionSets(m_session, &attachInfo), "xrAttachSessionActionSets", m_instance);
    }

    core::Result<void> OpenXrRuntime::requestSession(const SessionRequest& request)
    {
        if (sessionActive()) {
            return core::Unexpected(std::string("an XR session is already active"));
        }
        try {
            if (m_instance == XR_NULL_HANDLE) {
                createInstance();
            }
            createSession(request);
        } catch (const cpptrace::runtime_error& e) {
            destroySession();
            return core::Unexpected(std::format("XR session request failed: {}", e.message()));
        }
        core::Logger::info("XR session created ({}, {})", request.sessionMode, request.referenceSpace);
        return {};
    }

    void OpenXrRuntime::requestExit()
    {
        if (m_session == XR_NULL_HANDLE) {
            return;
        }
        const XrResult result = xrRequestExitSession(m_session);
        if (XR_FAILED(result)) {
            core::Logger::warn("xrRequestExitSession failed: {}", resultString(m_instance, result));
        }
    }

    void OpenXrRuntime::destroySession()
    {
        for (Hand& hand : m_hands) {
            hand.source.reset();
        }
        if (m_viewSpace != XR_NULL_HANDLE) {
            xrDestroySpace(m_viewSpace);
            m_viewSpace = XR_NULL_HANDLE;
        }
        if (m_appSpace != XR_NULL_HANDLE) {
            xrDestroySpace(m_appSpace);
            m_appSpace = XR_NULL_HANDLE;
        }
        if (m_session != XR_NULL_HANDLE) {
            xrDestroySession(m_session);
            m_session = XR_NULL_HANDLE;
        }
        m_running = false;
        m_sessionState = XR_SESSION_STATE_UNKNOWN;
        m_headPose.reset();
    }

    void OpenXrRuntime::pollEvents()
    {
        if (m_instance == XR_NULL_HANDLE) {
            return;
        }

        XrEventDataBuffer event{XR_TYPE_EVENT_DATA_BUFFER};
        XrResult result = xrPollEvent(m_instance, &event);
        while (result == XR_SUCCESS) {
            switch (event.type) {
                case XR_TYPE_EVENT_DATA_SESSION_STATE_CHANGED:
                    handleSessionStateChanged(*reinterpret_cast<const XrEventDataSessionStateChanged*>(&event));
                    break;
                case XR_TYPE_EVENT_DATA_INTERACTION_PROFILE_CHANGED:
                    addInputSources();
                    break;
                case XR_TYPE_EVENT_DATA_INSTANCE_LOSS_PENDING:
                    core::Logger::error("OpenXR instance loss pending");
                    break;
                default:
                    break;
            }
            if (m_session == XR_NULL_HANDLE) {
                break;
            }
            event = {XR_TYPE_EVENT_DATA_BUFFER};
            result = xrPollEvent(m_instance, &event);
        }

        if (m_running) {
            runFrame();
        }
    }

    void OpenXrRuntime::handleSessionStateChanged(const XrEventDataSessionStateChanged& changed)
    {
        m_sessionState = changed.state;
        switch (m_sessionState) {
            case XR_SESSION_STATE_READY: {
                XrSessionBeginInfo beginInfo{XR_TYPE_SESSION_BEGIN_INFO};
                beginInfo.primaryViewConfigurationType = XR_VIEW_CONFIGURATION_TYPE_PRIMARY_STEREO;
                const XrResult result = xrBeginSession(m_session, &beginInfo);
                if (XR_FAILED(result)) {
                    core::Logger::error("xrBeginSession failed: {}", resultString(m_instance, result));
                    requestExit();
                    break;
                }
                m_running = true;
                core::Logger::info("XR session running");
                break;
            }
            case XR_SESSION_STATE_STOPPING:
                m_running = false;
                if (const XrResult result = xrEndSession(m_session); XR_FAILED(result)) {
                    core::Logger::warn("xrEndSession failed: {}", resultString(m_instance, result));
                }
                break;
            case XR_SESSION_STATE_EXITING:
            case XR_SESSION_STATE_LOSS_PENDING:
                destroySession();
                core::Logger::info("XR session ended");
                onSessionEnded.notify();
                break;
            default:
                break;
        }
    }

    void OpenXrRuntime::addInputSources()
    {
        if (m_session == XR_NULL_HANDLE) {
            return;
        }
        constexpr Handedness kHandedness[] = {Handedness::Left, Handedness::Right};
        for (size_t i = 0; i < m_hands.size(); ++i) {
            Hand& hand = m_hands[i];
            XrInteractionProfileState profile{XR_TYPE_INTERACTION_PROFILE_STATE};
            if (XR_FAILED(xrGetCurrentInteractionProfile(m_session, hand.path, &profile))
                || profile.interactionProfile == XR_NULL_PATH || hand.source) {
                continue;
            }
            hand.source = std::make_unique<XrInputSource>(std::format("openxr-{}", toString(kHandedness[i])),
                                                          kHandedness[i]);
            onControllerAdded.notify(*hand.source);
            hand.source->initMotionController(makeStandardController(kHandedness[i]));
        }
    }

    void OpenXrRuntime::runFrame()
    {
        XrFrameWaitInfo waitInfo{XR_TYPE_FRAME_WAIT_INFO};
        XrFrameState frameState{XR_TYPE_FRAME_STATE};
        if (XR_FAILED(xrWaitFrame(m_session, &waitInfo, &frameState))) {
            return;
        }
        XrFrameBeginInfo beginInfo{XR_TYPE_FRAME_BEGIN_INFO};
        if (XR_FAILED(xrBeginFrame(m_session, &beginInfo))) {
            return;
        }

        XrSpaceLocation location{XR_TYPE_SPACE_LOCATION};
        if (XR_SUCCEEDED(xrLocateSpace(m_viewSpace, m_appSpace, frameState.predictedDisplayTime, &location))) {
            constexpr XrSpaceLocationFlags kValid =
                XR_SPACE_LOCATION_POSITION_VALID_BIT | XR_SPACE_LOCATION_ORIENTATION_VALID_BIT;
            if ((location.locationFlags & kValid) == kValid) {
                const XrPosef& pose = location.pose;
                m_headPose = HeadPose{
                    glm::vec3(pose.position.x, pose.position.y, pose.position.z),
                    glm::quat(pose.orientation.w, pose.orientation.x, pose.orientation.y, pose.orientation.z)};
            }
        }

        if (m_sessionState == XR_SESSION_STATE_FOCUSED) {
            syncInput();
        }

        XrFrameEndInfo endInfo{XR_TYPE_FRAME_END_INFO};
        endInfo.displayTime = frameState.predictedDisplayTime;
        endInfo.environmentBlendMode = XR_ENVIRONMENT_BLEND_MODE_OPAQUE;
        if (const XrResult result = xrEndFrame(m_session, &endInfo); XR_FAILED(result)) {
            core::Logger::warn("xrEndFrame failed: {}", resultString(m_instance, result));
        }
    }

    void OpenXrRuntime::syncInput()
    {
        const XrActiveActionSet active{m_actionSet, XR_NULL_PATH};
        XrActionsSyncInfo syncInfo{XR_TYPE_ACTIONS_SYNC_INFO};
        syncInfo.countActiveActionSets = 1;
        syncInfo.activeActionSets = &active;
        if (XR_FAILED(xrSyncActions(m_session, &syncInfo))) {
            return;
        }

        for (Hand& hand : m_hands) {
            MotionController* controller = hand.source ? hand.source->motionController() : nullptr;
            if (controller == nullptr) {
                continue;
            }

            XrActionStateGetInfo getInfo{XR_TYPE_ACTION_STATE_GET_INFO};
            getInfo.subactionPath = hand.path;

            auto readFloat = [&](XrAction action) {
                getInfo.action = action;
                XrActionStateFloat state{XR_TYPE_ACTION_STATE_FLOAT};
                const bool ok = XR_SUCCEEDED(xrGetActionStateFloat(m_session, &getInfo, &state));
                return ok && state.isActive ? state.currentState : 0.0f;
            };
            auto readBool = [&](XrAction action) {
                getInfo.action = action;
                XrActionStateBoolean state{XR_TYPE_ACTION_STATE_BOOLEAN};
                const bool ok = XR_SUCCEEDED(xrGetActionStateBoolean(m_session, &getInfo, &state));
                return ok && state.isActive && state.currentState == XR_TRUE;
            };

            getInfo.action = m_thumbstickAction;
            XrActionStateVector2f stick{XR_TYPE_ACTION_STATE_VECTOR2F};
            AxisValues axes;
            if (XR_SUCCEEDED(xrGetActionStateVector2f(m_session, &getInfo, &stick)) && stick.isActive) {
                // xr-standard reports +y for stick pulled back
                axes = AxisValues{stick.currentState.x, -stick.currentState.y};
            }
            controller->updateComponent(component_ids::Thumbstick, 0.0f, false, axes);

            const float trigger = readFloat(m_triggerAction);
            const ControllerComponent* triggerComponent = controller->getComponent(component_ids::Trigger);
            controller->updateComponent(component_ids::Trigger, trigger,
                                        analogPressed(trigger, triggerComponent && triggerComponent->pressed()));

            const float squeeze = readFloat(m_squeezeAction);
            const ControllerComponent* squeezeComponent = controller->getComponent(component_ids::Squeeze);
            controller->updateComponent(component_ids::Squeeze, squeeze,
                                        analogPressed(squeeze, squeezeComponent && squeezeComponent->pressed()));

            const bool left = controller->handedness() == Handedness::Left;
            const bool primary = readBool(m_primaryAction);
            const bool secondary = readBool(m_secondaryAction);
            controller->updateComponent(left ? component_ids::ButtonX : component_ids::ButtonA,
                                        primary ? 1.0f : 0.0f, primary);
            controller->updateComponent(left ? component_ids::ButtonY : component_ids::ButtonB,
                                        secondary ? 1.0f : 0.0f, secondary);
        }
    }
}
