#include "interaction/EventDispatcher.h"
#include "interaction/HoverTracker.h"
#include "interaction/ObjectRegistry.h"

namespace Vireo::Interaction {

namespace {
    // Retained events must not reach back into a finished pass.
    class PropagationScope {
    public:
        explicit PropagationScope(std::shared_ptr<PropagationState> state) : state_(std::move(state)) {}
        ~PropagationScope() {
            state_->active = false;
            state_->onStop = nullptr;
        }
        PropagationScope(const PropagationScope&) = delete;
        PropagationScope& operator=(const PropagationScope&) = delete;

    private:
        std::shared_ptr<PropagationState> state_;
    };
}

EventDispatcher::EventDispatcher(const ObjectRegistry& registry, HoverTracker& hoverTracker)
    : registry_(registry), hoverTracker_(hoverTracker) {}

void EventDispatcher::Dispatch(const HitResult& hits, const Controller& controller, const Callback& callback) {
    if (hits.empty()) {
        return;
    }

    auto state = std::make_shared<PropagationState>();
    PropagationScope scope(state);

    const std::shared_ptr<const HitList> intersections = hits.intersections;
    state->onStop = [this, &hits, &controller, intersections](NodeId eventObject, size_t pairIndex) {
        if (registry_.IsEmpty() || !hoverTracker_.IsHovered(controller.handedness, eventObject)) {
            return;
        }
        auto processed = std::make_shared<const HitList>(
            intersections->begin(), intersections->begin() + static_cast<std::ptrdiff_t>(pairIndex + 1));
        hoverTracker_.CancelHover(registry_, controller, processed, hits.hitSet);
    };

    for (size_t i = 0; i < hits.size(); ++i) {
        state->index = i;

        InteractionWithIntersectionEvent withHit;
        withHit.eventObject = hits.eventObjects[i];
        withHit.controller = controller;
        withHit.intersections = intersections;
        withHit.intersection = (*intersections)[i];
        withHit.stopped = state->stopped;
        withHit.pairIndex = i;
        withHit.propagation = state;

        auto event = std::make_shared<InteractionEvent>(std::move(withHit));
        callback(event);

        if (state->stopped) {
            break;
        }
    }
}

} // namespace Vireo::Interaction
