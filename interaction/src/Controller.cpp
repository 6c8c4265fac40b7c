#include "interaction/Controller.h"
#include <algorithm>
#include <iostream>

namespace Vireo::Interaction {

const char* ToString(Handedness handedness) {
    switch (handedness) {
        case Handedness::Left: return "left";
        case Handedness::Right: return "right";
        case Handedness::None: return "none";
    }
    return "none";
}

const Controller* IControllerSource::FindByHandedness(Handedness handedness) const {
    for (const auto& controller : GetControllers()) {
        if (controller.handedness == handedness) {
            return &controller;
        }
    }
    return nullptr;
}

const Controller* IControllerSource::FindById(uint32_t id) const {
    for (const auto& controller : GetControllers()) {
        if (controller.id == id) {
            return &controller;
        }
    }
    return nullptr;
}

uint32_t ControllerRig::AddController(Handedness handedness, const glm::mat4& worldTransform) {
    Controller controller;
    controller.id = nextId_++;
    controller.handedness = handedness;
    controller.worldTransform = worldTransform;
    controllers_.push_back(controller);
    std::cout << "ControllerRig: Added " << ToString(handedness) << " controller " << controller.id << std::endl;
    return controller.id;
}

bool ControllerRig::RemoveController(uint32_t id) {
    auto it = std::find_if(controllers_.begin(), controllers_.end(), [id](const Controller& c) { return c.id == id; });
    if (it == controllers_.end()) {
        return false;
    }
    std::cout << "ControllerRig: Removed " << ToString(it->handedness) << " controller " << id << std::endl;
    controllers_.erase(it);
    return true;
}

bool ControllerRig::SetWorldTransform(uint32_t id, const glm::mat4& worldTransform) {
    for (auto& controller : controllers_) {
        if (controller.id == id) {
            controller.worldTransform = worldTransform;
            return true;
        }
    }
    return false;
}

const Controller* ControllerRig::GetController(uint32_t id) const {
    return FindById(id);
}

const std::vector<Controller>& ControllerRig::GetControllers() const {
    return controllers_;
}

} // namespace Vireo::Interaction
