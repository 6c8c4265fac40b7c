#pragma once

#include "interaction/Controller.h"
#include "engine/ray.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <variant>
#include <vector>

namespace Vireo::Interaction {

using NodeId = uint64_t;
using HandlerId = uint64_t;

// A geometric hit. objectId is the node that owns the hit geometry, which is
// not necessarily the node an event is delivered to.
using Intersection = Engine::RayHit;
using HitList = std::vector<Intersection>;

enum class InteractionType {
    Hover = 0,
    Blur,
    SelectStart,
    SelectEnd,
    Select,
    SqueezeStart,
    SqueezeEnd,
    Squeeze,
    SelectMissed
};

const size_t INTERACTION_TYPE_COUNT = 9;

// Hover and the select/squeeze family carry an intersection. Blur and SelectMissed do not.
bool IsWithIntersection(InteractionType type);
const char* ToString(InteractionType type);

// Shared between every event of one dispatch pass. Once the pass returns,
// active is cleared and stopping a retained event only marks that event.
struct PropagationState {
    bool stopped = false;
    bool active = true;
    size_t index = 0;
    std::function<void(NodeId eventObject, size_t pairIndex)> onStop;
};

struct InteractionBaseEvent {
    NodeId eventObject = 0;
    Controller controller;
    // Hit list of the pass that produced the event. Never null for events built by the dispatcher.
    std::shared_ptr<const HitList> intersections;

    const HitList& GetIntersections() const;
};

struct InteractionWithIntersectionEvent : InteractionBaseEvent {
    Intersection intersection;
    bool stopped = false;
    size_t pairIndex = 0;
    std::shared_ptr<PropagationState> propagation;

    // Ends the current pass after this event object. Handlers already
    // registered on the same object still run.
    void StopPropagation();
};

struct InteractionNoIntersectionEvent : InteractionBaseEvent {};

using InteractionEvent = std::variant<InteractionWithIntersectionEvent, InteractionNoIntersectionEvent>;
using InteractionHandler = std::function<void(InteractionEvent&)>;

NodeId GetEventObject(const InteractionEvent& event);
const Controller& GetController(const InteractionEvent& event);

// Delivered to the global miss handler; there is no event object.
struct GlobalSelectMissedEvent {
    Controller controller;
    std::shared_ptr<const HitList> intersections;
};

using GlobalSelectMissedHandler = std::function<void(const GlobalSelectMissedEvent&)>;

} // namespace Vireo::Interaction
