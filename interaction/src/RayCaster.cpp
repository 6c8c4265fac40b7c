#include "interaction/RayCaster.h"
#include "engine/scene.h"
#include <glm/geometric.hpp>

namespace Vireo::Interaction {

namespace {
    const float MIN_AXIS_LENGTH = 1e-8f;

    glm::vec3 SafeNormalize(const glm::vec3& v) {
        float len = glm::length(v);
        return len > MIN_AXIS_LENGTH ? v / len : v;
    }
}

RayCaster::RayCaster(const Engine::Scene& scene, const glm::vec3& localForward, float nearDistance, float farDistance)
    : scene_(scene), localForward_(localForward), nearDistance_(nearDistance), farDistance_(farDistance) {}

Engine::Ray RayCaster::BuildRay(const glm::mat4& controllerWorld) const {
    // Strip scale from the basis so only the orientation turns the forward axis.
    glm::mat3 rotation(
        SafeNormalize(glm::vec3(controllerWorld[0])),
        SafeNormalize(glm::vec3(controllerWorld[1])),
        SafeNormalize(glm::vec3(controllerWorld[2])));

    Engine::Ray ray;
    ray.origin = glm::vec3(controllerWorld[3]);
    ray.direction = SafeNormalize(rotation * localForward_);
    ray.nearDistance = nearDistance_;
    ray.farDistance = farDistance_;
    return ray;
}

HitList RayCaster::Cast(const Controller& controller, const std::vector<NodeId>& roots) const {
    if (roots.empty()) {
        return {};
    }
    return scene_.IntersectObjects(BuildRay(controller.worldTransform), roots, true);
}

} // namespace Vireo::Interaction
