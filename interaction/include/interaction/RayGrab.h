#pragma once

#include "interaction/DeviceEvents.h"
#include "interaction/IFrameListener.h"
#include "interaction/Interactive.h"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>

namespace Vireo::Interaction {

class InteractionManager;

// Lets a controller drag a node by its ray. Select-start on the node picks it up,
// select-end from the same controller drops it. While held, every frame applies the
// controller's pose change since the previous frame to the node's local transform,
// so the node stays where it is in the scene hierarchy.
class RayGrab : public IFrameListener {
public:
    RayGrab(InteractionManager& manager, NodeId node);
    ~RayGrab() override;

    RayGrab(const RayGrab&) = delete;
    RayGrab& operator=(const RayGrab&) = delete;

    void OnFrameUpdate() override;

    bool IsGrabbing() const { return grabbingControllerId_.has_value(); }
    // 0 while idle.
    uint32_t GetGrabbingControllerId() const { return grabbingControllerId_.value_or(0); }
    NodeId GetNode() const { return node_; }

private:
    void StartGrab(const InteractionWithIntersectionEvent& event);
    void OnSelectEnd(const DeviceEvent& event);
    void Release();

    InteractionManager& manager_;
    NodeId node_;
    Interactive interactive_;
    SubscriptionId selectEndSubscription_ = 0;

    std::optional<uint32_t> grabbingControllerId_;
    glm::mat4 previousInverse_ = glm::mat4(1.0f);
};

} // namespace Vireo::Interaction
