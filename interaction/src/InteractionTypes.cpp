#include "interaction/InteractionTypes.h"

namespace Vireo::Interaction {

bool IsWithIntersection(InteractionType type) {
    return type != InteractionType::Blur && type != InteractionType::SelectMissed;
}

const char* ToString(InteractionType type) {
    switch (type) {
        case InteractionType::Hover: return "onHover";
        case InteractionType::Blur: return "onBlur";
        case InteractionType::SelectStart: return "onSelectStart";
        case InteractionType::SelectEnd: return "onSelectEnd";
        case InteractionType::Select: return "onSelect";
        case InteractionType::SqueezeStart: return "onSqueezeStart";
        case InteractionType::SqueezeEnd: return "onSqueezeEnd";
        case InteractionType::Squeeze: return "onSqueeze";
        case InteractionType::SelectMissed: return "onSelectMissed";
    }
    return "unknown";
}

const HitList& InteractionBaseEvent::GetIntersections() const {
    static const HitList empty;
    return intersections ? *intersections : empty;
}

void InteractionWithIntersectionEvent::StopPropagation() {
    stopped = true;
    if (!propagation) return;
    propagation->stopped = true;
    if (propagation->active && propagation->onStop) {
        propagation->onStop(eventObject, pairIndex);
    }
}

NodeId GetEventObject(const InteractionEvent& event) {
    return std::visit([](const auto& e) { return e.eventObject; }, event);
}

const Controller& GetController(const InteractionEvent& event) {
    return std::visit([](const auto& e) -> const Controller& { return e.controller; }, event);
}

} // namespace Vireo::Interaction
