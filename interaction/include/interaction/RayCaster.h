#pragma once

#include "interaction/InteractionTypes.h"
#include "engine/ray.h"
#include <glm/glm.hpp>
#include <limits>
#include <vector>

namespace Vireo::Engine { class Scene; }

namespace Vireo::Interaction {

// Builds the pointing ray of a controller and casts it against the subtrees of the registered nodes.
class RayCaster {
public:
    RayCaster(const Engine::Scene& scene,
              const glm::vec3& localForward = glm::vec3(0.0f, 0.0f, -1.0f),
              float nearDistance = 0.0f,
              float farDistance = std::numeric_limits<float>::infinity());

    // Origin is the controller position. Direction is the controller orientation applied
    // to the local forward axis; scale in the controller transform is ignored.
    Engine::Ray BuildRay(const glm::mat4& controllerWorld) const;

    // Distance-ordered hits. Empty when there are no roots.
    HitList Cast(const Controller& controller, const std::vector<NodeId>& roots) const;

private:
    const Engine::Scene& scene_;
    glm::vec3 localForward_;
    float nearDistance_;
    float farDistance_;
};

} // namespace Vireo::Interaction
