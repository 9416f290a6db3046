#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mmdv/core/Observable.hpp"
#include "mmdv/xr/XrTypes.hpp"

namespace mmdv::xr
{
    // Component ids of the xr-standard gamepad mapping
    namespace component_ids
    {
        inline constexpr const char* Trigger = "xr-standard-trigger";
        inline constexpr const char* Squeeze = "xr-standard-squeeze";
        inline constexpr const char* Thumbstick = "xr-standard-thumbstick";
        inline constexpr const char* ButtonA = "a-button";
        inline constexpr const char* ButtonB = "b-button";
        inline constexpr const char* ButtonX = "x-button";
        inline constexpr const char* ButtonY = "y-button";
    }

    enum class ComponentType : uint8_t
    {
        Trigger,
        Squeeze,
        Thumbstick,
        Button
    };

    struct AxisValues
    {
        float x = 0.0f;
        float y = 0.0f;

        bool operator==(const AxisValues&) const = default;
    };

    class ControllerComponent
    {
    public:
        ControllerComponent(std::string id, ComponentType type) : m_id(std::move(id)), m_type(type) {}

        ControllerComponent(const ControllerComponent&) = delete;
        ControllerComponent& operator=(const ControllerComponent&) = delete;

        [[nodiscard]] const std::string& id() const { return m_id; }
        [[nodiscard]] ComponentType type() const { return m_type; }
        [[nodiscard]] bool pressed() const { return m_pressed; }
        [[nodiscard]] float value() const { return m_value; }
        [[nodiscard]] const AxisValues& axes() const { return m_axes; }

        // Stores the new state and notifies the observers whose value changed
        void update(float value, bool pressed, const AxisValues& axes = {});

        core::Observable<const AxisValues&> onAxisValueChanged;
        core::Observable<const ControllerComponent&> onButtonStateChanged;

    private:
        std::string m_id;
        ComponentType m_type;
        float m_value = 0.0f;
        bool m_pressed = false;
        AxisValues m_axes;
    };

    class MotionController
    {
    public:
        explicit MotionController(Handedness handedness) : m_handedness(handedness) {}

        MotionController(const MotionController&) = delete;
        MotionController& operator=(const MotionController&) = delete;

        ControllerComponent& addComponent(const std::string& id, ComponentType type, bool isMain = false);

        [[nodiscard]] ControllerComponent* getComponent(const std::string& id) const;
        [[nodiscard]] ControllerComponent* getMainComponent() const;
        [[nodiscard]] std::vector<std::string> getComponentIds() const;
        [[nodiscard]] Handedness handedness() const { return m_handedness; }

        // Returns false and changes nothing for an unknown id
        bool updateComponent(const std::string& id, float value, bool pressed, const AxisValues& axes = {});

    private:
        Handedness m_handedness;
        std::vector<std::unique_ptr<ControllerComponent>> m_components;
        ControllerComponent* m_main = nullptr;
    };

    // Trigger (main), squeeze, thumbstick and the two face buttons of the hand
    std::unique_ptr<MotionController> makeStandardController(Handedness handedness);

    // A tracked hand. The motion controller is attached once its layout is
    // known, which is announced through onMotionControllerInit.
    class XrInputSource
    {
    public:
        XrInputSource(std::string uniqueId, Handedness handedness)
            : m_uniqueId(std::move(uniqueId)), m_handedness(handedness) {}

        XrInputSource(const XrInputSource&) = delete;
        XrInputSource& operator=(const XrInputSource&) = delete;

        void initMotionController(std::unique_ptr<MotionController> controller);

        [[nodiscard]] const std::string& uniqueId() const { return m_uniqueId; }
        [[nodiscard]] Handedness handedness() const { return m_handedness; }
        [[nodiscard]] MotionController* motionController() const { return m_controller.get(); }

        core::Observable<MotionController&> onMotionControllerInit;

    private:
        std::string m_uniqueId;
        Handedness m_handedness;
        std::unique_ptr<MotionController> m_controller;
    };
}
