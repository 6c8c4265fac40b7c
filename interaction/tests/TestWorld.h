#pragma once

#include "engine/scene.h"
#include "engine/scene_node.h"
#include "engine/geometry/Primitives.h"
#include "interaction/Controller.h"
#include "interaction/DeviceEvents.h"
#include "interaction/InteractionManager.h"
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <string>

namespace Vireo::Interaction::Testing {

// Scene, controller rig, event bus and manager wired together. The right
// controller starts at the origin pointing down -Z.
struct TestWorld {
    Engine::Scene scene;
    ControllerRig rig;
    DeviceEventBus bus;
    InteractionManager manager{scene, rig, bus};
    uint32_t right = rig.AddController(Handedness::Right);

    NodeId AddBox(const std::string& name, const glm::vec3& position, NodeId parent = 0, float size = 1.0f) {
        Engine::SceneNode* node = scene.create_mesh_object(name, Engine::Primitives::CreateBox(size, size, size), parent);
        scene.SetLocalTransform(node->get_id(), glm::translate(glm::mat4(1.0f), position));
        return node->get_id();
    }

    NodeId AddGroup(const std::string& name, NodeId parent = 0) {
        return scene.create_object(name, parent)->get_id();
    }

    void MoveNode(NodeId node, const glm::vec3& position) {
        scene.SetLocalTransform(node, glm::translate(glm::mat4(1.0f), position));
    }

    void Aim(uint32_t controllerId, const glm::vec3& position) {
        rig.SetWorldTransform(controllerId, glm::translate(glm::mat4(1.0f), position));
    }

    const Controller& Get(uint32_t controllerId) const {
        return *rig.GetController(controllerId);
    }

    void Emit(DeviceEventType type, uint32_t controllerId) {
        bus.Emit(type, Get(controllerId));
    }
};

} // namespace Vireo::Interaction::Testing
