#include "mmdv/xr/MotionController.hpp"
#include "mmdv/core/logger.hpp"

#include <algorithm>
#include <format>

namespace mmdv::xr
{
    core::Result<LocomotionMode> parseLocomotionMode(const std::string& text)
    {
        if (text == "free") {
            return LocomotionMode::Free;
        }
        if (text == "teleport") {
            return LocomotionMode::Teleport;
        }
        return core::Unexpected(std::format("unknown locomotion mode '{}' (expected free or teleport)", text));
    }

    const char* toString(Handedness handedness)
    {
        switch (handedness) {
            case Handedness::Left: return "left";
            case Handedness::Right: return "right";
            case Handedness::None: break;
        }
        return "none";
    }

    const char* toString(XrState state)
    {
        return state == XrState::InXr ? "IN_XR" : "NOT_IN_XR";
    }

    void ControllerComponent::update(float value, bool pressed, const AxisValues& axes)
    {
        const bool buttonChanged = pressed != m_pressed || value != m_value;
        const bool axesChanged = axes != m_axes;
        m_value = value;
        m_pressed = pressed;
        m_axes = axes;

        if (buttonChanged) {
            onButtonStateChanged.notify(*this);
        }
        if (axesChanged) {
            onAxisValueChanged.notify(m_axes);
        }
    }

    ControllerComponent& MotionController::addComponent(const std::string& id, ComponentType type, bool isMain)
    {
        if (ControllerComponent* existing = getComponent(id)) {
            return *existing;
        }
        m_components.push_back(std::make_unique<ControllerComponent>(id, type));
        ControllerComponent& component = *m_components.back();
        if (isMain || m_main == nullptr) {
            m_main = &component;
        }
        return component;
    }

    ControllerComponent* MotionController::getComponent(const std::string& id) const
    {
        auto it = std::find_if(m_components.begin(), m_components.end(),
                               [&](const auto& c) { return c->id() == id; });
        return it != m_components.end() ? it->get() : nullptr;
    }

    ControllerComponent* MotionController::getMainComponent() const
    {
        return m_main;
    }

    std::vector<std::string> MotionController::getComponentIds() const
    {
        std::vector<std::string> ids;
        ids.reserve(m_components.size());
        for (const auto& component : m_components) {
            ids.push_back(component->id());
        }
        return ids;
    }

    bool MotionController::updateComponent(const std::string& id, float value, bool pressed, const AxisValues& axes)
    {
        ControllerComponent* component = getComponent(id);
        if (component == nullptr) {
            core::Logger::debug("Ignoring input for unknown component '{}' on {} controller", id,
                                toString(m_handedness));
            return false;
        }
        component->update(value, pressed, axes);
        return true;
    }

    std::unique_ptr<MotionController> makeStandardController(Handedness handedness)
    {
        auto controller = std::make_unique<MotionController>(handedness);
        controller->addComponent(component_ids::Trigger, ComponentType::Trigger, true);
        controller->addComponent(component_ids::Squeeze, ComponentType::Squeeze);
        controller->addComponent(component_ids::Thumbstick, ComponentType::Thumbstick);
        if (handedness == Handedness::Left) {
            controller->addComponent(component_ids::ButtonX, ComponentType::Button);
            controller->addComponent(component_ids::ButtonY, ComponentType::Button);
        } else {
            controller->addComponent(component_ids::ButtonA, ComponentType::Button);
            controller->addComponent(component_ids::ButtonB, ComponentType::Button);
        }
        return controller;
    }

    void XrInputSource::initMotionController(std::unique_ptr<MotionController> controller)
    {
        m_controller = std::move(controller);
        if (m_controller) {
            onMotionControllerInit.notify(*m_controller);
        }
    }
}
