#pragma once

#include "interaction/DeviceEvents.h"
#include "interaction/EventDispatcher.h"
#include "interaction/HitCompiler.h"
#include "interaction/HoverTracker.h"
#include "interaction/InteractionTypes.h"
#include "interaction/ObjectRegistry.h"
#include "interaction/RayCaster.h"
#include <glm/glm.hpp>
#include <limits>
#include <optional>
#include <vector>

namespace Vireo::Engine { class Scene; }

namespace Vireo::Interaction {

class IControllerSource;
class IFrameListener;

// Owns the interaction state of one scene: registered targets, hover state and the
// ray casting setup. Driven by Tick() once per frame and by device events from the bus.
class InteractionManager {
public:
    struct Config {
        glm::vec3 rayForward = glm::vec3(0.0f, 0.0f, -1.0f); // Controller-local pointing axis
        float rayNear = 0.0f;
        float rayFar = std::numeric_limits<float>::infinity();
        bool verbose = false; // Log every dispatched interaction
    };

    InteractionManager(Engine::Scene& scene, IControllerSource& controllers, DeviceEventBus& eventBus);
    InteractionManager(Engine::Scene& scene, IControllerSource& controllers, DeviceEventBus& eventBus, const Config& config);
    ~InteractionManager();

    InteractionManager(const InteractionManager&) = delete;
    InteractionManager& operator=(const InteractionManager&) = delete;

    // --- Registration ---
    HandlerId AddInteraction(NodeId node, InteractionType type, InteractionHandler handler);
    void RemoveInteraction(NodeId node, InteractionType type, HandlerId handlerId);
    // Called once per select that hits no registered node. An empty handler clears it.
    void SetGlobalOnSelectMissed(GlobalSelectMissedHandler handler);

    // --- Frame and input ---
    void Tick();
    void OnDeviceEvent(DeviceEventType type, const Controller& controller);
    void AddFrameListener(IFrameListener* listener);
    void RemoveFrameListener(IFrameListener* listener);

    // --- Queries ---
    HitResult GetIntersections(const Controller& controller) const;
    bool IsHovered(Handedness handedness, NodeId node) const;
    const std::optional<Intersection>& GetHoverClosest(Handedness handedness) const;
    const HoverTracker& GetHoverTracker() const { return hoverTracker_; }
    const ObjectRegistry& GetRegistry() const { return registry_; }

    Engine::Scene& GetScene() { return scene_; }
    const IControllerSource& GetControllerSource() const { return controllers_; }
    DeviceEventBus& GetEventBus() { return eventBus_; }
    const Config& GetConfig() const { return config_; }

    static InteractionType ToInteractionType(DeviceEventType type);

private:
    void updateHover(const Controller& controller);
    void triggerEvent(InteractionType type, const Controller& controller);
    void notifySelectMissed(const HitResult& hits, const Controller& controller);
    void logDispatch(InteractionType type, NodeId node, const Controller& controller) const;

    Engine::Scene& scene_;
    IControllerSource& controllers_;
    DeviceEventBus& eventBus_;
    Config config_;

    ObjectRegistry registry_;
    RayCaster rayCaster_;
    HitCompiler hitCompiler_;
    HoverTracker hoverTracker_;
    EventDispatcher dispatcher_;

    GlobalSelectMissedHandler globalOnSelectMissed_;
    std::vector<IFrameListener*> frameListeners_;
    std::vector<SubscriptionId> subscriptions_;
};

} // namespace Vireo::Interaction
