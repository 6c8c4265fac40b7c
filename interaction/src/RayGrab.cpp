#include "interaction/RayGrab.h"
#include "interaction/Controller.h"
#include "interaction/InteractionManager.h"
#include "engine/scene.h"
#include "engine/scene_node.h"
#include <iostream>

namespace Vireo::Interaction {

RayGrab::RayGrab(InteractionManager& manager, NodeId node)
    : manager_(manager), node_(node)
{
    InteractiveHandlers handlers;
    handlers.onSelectStart = [this](InteractionWithIntersectionEvent& event) { StartGrab(event); };
    interactive_ = Interactive(&manager_, node_, handlers);

    selectEndSubscription_ = manager_.GetEventBus().Subscribe(DeviceEventType::SelectEnd,
        [this](const DeviceEvent& event) { OnSelectEnd(event); });
    manager_.AddFrameListener(this);
}

RayGrab::~RayGrab() {
    manager_.RemoveFrameListener(this);
    manager_.GetEventBus().Unsubscribe(selectEndSubscription_);
    interactive_.Reset();
}

void RayGrab::StartGrab(const InteractionWithIntersectionEvent& event) {
    grabbingControllerId_ = event.controller.id;
    previousInverse_ = glm::inverse(event.controller.worldTransform);
    std::cout << "RayGrab: Node " << node_ << " grabbed by " << ToString(event.controller.handedness)
              << " controller " << event.controller.id << "." << std::endl;
}

void RayGrab::OnSelectEnd(const DeviceEvent& event) {
    if (!grabbingControllerId_ || *grabbingControllerId_ != event.controller.id) {
        return;
    }
    std::cout << "RayGrab: Node " << node_ << " released by controller " << event.controller.id << "." << std::endl;
    Release();
}

void RayGrab::Release() {
    grabbingControllerId_.reset();
    previousInverse_ = glm::mat4(1.0f);
}

void RayGrab::OnFrameUpdate() {
    if (!grabbingControllerId_) {
        return;
    }

    const Controller* controller = manager_.GetControllerSource().FindById(*grabbingControllerId_);
    if (!controller) {
        std::cout << "RayGrab: Controller " << *grabbingControllerId_ << " is gone, releasing node " << node_ << "." << std::endl;
        Release();
        return;
    }

    Engine::Scene& scene = manager_.GetScene();
    const Engine::SceneNode* node = scene.get_object_by_id(node_);
    if (!node) {
        std::cerr << "RayGrab: Warning! Grabbed node " << node_ << " no longer exists, releasing." << std::endl;
        Release();
        return;
    }

    // Undo the previous controller pose, then apply the current one.
    const glm::mat4& controllerWorld = controller->worldTransform;
    glm::mat4 transform = controllerWorld * previousInverse_ * node->getTransform();
    scene.SetLocalTransform(node_, transform);
    previousInverse_ = glm::inverse(controllerWorld);
}

} // namespace Vireo::Interaction
