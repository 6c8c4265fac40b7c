#include "interaction/InteractionManager.h"
#include "interaction/Controller.h"
#include "interaction/IFrameListener.h"
#include "engine/scene.h"
#include <algorithm>
#include <iostream>

namespace Vireo::Interaction {

namespace {
    const DeviceEventType DEVICE_EVENT_TYPES[] = {
        DeviceEventType::Select,
        DeviceEventType::SelectStart,
        DeviceEventType::SelectEnd,
        DeviceEventType::Squeeze,
        DeviceEventType::SqueezeStart,
        DeviceEventType::SqueezeEnd
    };
}

InteractionManager::InteractionManager(Engine::Scene& scene, IControllerSource& controllers, DeviceEventBus& eventBus)
    : InteractionManager(scene, controllers, eventBus, Config()) {}

InteractionManager::InteractionManager(Engine::Scene& scene, IControllerSource& controllers, DeviceEventBus& eventBus, const Config& config)
    : scene_(scene),
      controllers_(controllers),
      eventBus_(eventBus),
      config_(config),
      rayCaster_(scene, config.rayForward, config.rayNear, config.rayFar),
      hitCompiler_(scene, registry_, rayCaster_),
      dispatcher_(registry_, hoverTracker_)
{
    for (DeviceEventType type : DEVICE_EVENT_TYPES) {
        subscriptions_.push_back(eventBus_.Subscribe(type, [this](const DeviceEvent& event) {
            OnDeviceEvent(event.type, event.controller);
        }));
    }
}

InteractionManager::~InteractionManager() {
    for (SubscriptionId id : subscriptions_) {
        eventBus_.Unsubscribe(id);
    }
}

HandlerId InteractionManager::AddInteraction(NodeId node, InteractionType type, InteractionHandler handler) {
    const bool isNewTarget = !registry_.Has(node);
    HandlerId id = registry_.Add(node, type, std::move(handler));
    if (isNewTarget) {
        std::cout << "InteractionManager: Node " << node << " is now an interaction target." << std::endl;
    }
    return id;
}

void InteractionManager::RemoveInteraction(NodeId node, InteractionType type, HandlerId handlerId) {
    if (!registry_.Remove(node, type, handlerId)) {
        return;
    }
    if (!registry_.Has(node)) {
        hoverTracker_.Purge(node);
        std::cout << "InteractionManager: Node " << node << " is no longer an interaction target." << std::endl;
    } else {
        hoverTracker_.ClearClosestIfObject(node);
    }
}

void InteractionManager::SetGlobalOnSelectMissed(GlobalSelectMissedHandler handler) {
    globalOnSelectMissed_ = std::move(handler);
}

void InteractionManager::Tick() {
    if (!registry_.IsEmpty()) {
        // Handlers may add or remove controllers; this frame works on a copy.
        const std::vector<Controller> controllers = controllers_.GetControllers();
        for (const auto& controller : controllers) {
            updateHover(controller);
        }
    }

    const std::vector<IFrameListener*> listeners = frameListeners_;
    for (IFrameListener* listener : listeners) {
        // Skip listeners removed by an earlier listener this frame.
        if (std::find(frameListeners_.begin(), frameListeners_.end(), listener) == frameListeners_.end()) {
            continue;
        }
        listener->OnFrameUpdate();
    }
}

void InteractionManager::OnDeviceEvent(DeviceEventType type, const Controller& controller) {
    triggerEvent(ToInteractionType(type), controller);
}

void InteractionManager::AddFrameListener(IFrameListener* listener) {
    if (!listener) return;
    if (std::find(frameListeners_.begin(), frameListeners_.end(), listener) == frameListeners_.end()) {
        frameListeners_.push_back(listener);
    }
}

void InteractionManager::RemoveFrameListener(IFrameListener* listener) {
    frameListeners_.erase(std::remove(frameListeners_.begin(), frameListeners_.end(), listener), frameListeners_.end());
}

HitResult InteractionManager::GetIntersections(const Controller& controller) const {
    return hitCompiler_.Compile(controller);
}

bool InteractionManager::IsHovered(Handedness handedness, NodeId node) const {
    return hoverTracker_.IsHovered(handedness, node);
}

const std::optional<Intersection>& InteractionManager::GetHoverClosest(Handedness handedness) const {
    return hoverTracker_.GetClosest(handedness);
}

InteractionType InteractionManager::ToInteractionType(DeviceEventType type) {
    switch (type) {
        case DeviceEventType::Select: return InteractionType::Select;
        case DeviceEventType::SelectStart: return InteractionType::SelectStart;
        case DeviceEventType::SelectEnd: return InteractionType::SelectEnd;
        case DeviceEventType::Squeeze: return InteractionType::Squeeze;
        case DeviceEventType::SqueezeStart: return InteractionType::SqueezeStart;
        case DeviceEventType::SqueezeEnd: return InteractionType::SqueezeEnd;
    }
    return InteractionType::Select;
}

void InteractionManager::updateHover(const Controller& controller) {
    const Handedness handedness = controller.handedness;
    const HitResult hits = hitCompiler_.Compile(controller);

    hoverTracker_.SetClosest(handedness, hits.GetClosest());
    hoverTracker_.CancelHover(registry_, controller, hits.intersections, hits.hitSet);

    dispatcher_.Dispatch(hits, controller, [this, &controller, handedness](const std::shared_ptr<InteractionEvent>& event) {
        auto& withHit = std::get<InteractionWithIntersectionEvent>(*event);
        const NodeId node = withHit.eventObject;

        HoverTracker::HoverRecord record = hoverTracker_.GetRecord(handedness, node);
        if (!record) {
            hoverTracker_.AddRecord(handedness, node, event);
            if (registry_.Has(node, InteractionType::Hover)) {
                if (config_.verbose) logDispatch(InteractionType::Hover, node, controller);
                registry_.Invoke(node, InteractionType::Hover, *event);
            }
        } else if (std::get<InteractionWithIntersectionEvent>(*record).stopped) {
            // Keep last frame's stop in force without hovering again.
            withHit.StopPropagation();
        }
    });
}

void InteractionManager::triggerEvent(InteractionType type, const Controller& controller) {
    const HitResult hits = hitCompiler_.Compile(controller);

    if (type == InteractionType::Select) {
        notifySelectMissed(hits, controller);
    }

    dispatcher_.Dispatch(hits, controller, [this, type, &controller](const std::shared_ptr<InteractionEvent>& event) {
        const NodeId node = GetEventObject(*event);
        if (config_.verbose) logDispatch(type, node, controller);
        registry_.Invoke(node, type, *event);
    });
}

void InteractionManager::notifySelectMissed(const HitResult& hits, const Controller& controller) {
    // Handlers may unregister nodes while we walk the registry.
    const std::vector<NodeId> nodes = registry_.GetNodes();
    for (NodeId node : nodes) {
        if (hits.WasHit(node) || !registry_.Has(node, InteractionType::SelectMissed)) {
            continue;
        }
        InteractionNoIntersectionEvent missed;
        missed.eventObject = node;
        missed.controller = controller;
        missed.intersections = hits.intersections;
        InteractionEvent event = missed;
        if (config_.verbose) logDispatch(InteractionType::SelectMissed, node, controller);
        registry_.Invoke(node, InteractionType::SelectMissed, event);
    }

    if (globalOnSelectMissed_ && hits.hitSet.empty()) {
        GlobalSelectMissedEvent event;
        event.controller = controller;
        event.intersections = hits.intersections;
        globalOnSelectMissed_(event);
    }
}

void InteractionManager::logDispatch(InteractionType type, NodeId node, const Controller& controller) const {
    std::cout << "InteractionManager: " << ToString(type) << " -> node " << node
              << " (" << ToString(controller.handedness) << " controller " << controller.id << ")" << std::endl;
}

} // namespace Vireo::Interaction
