#pragma once

#include "interaction/HitCompiler.h"
#include "interaction/InteractionTypes.h"
#include <functional>
#include <memory>

namespace Vireo::Interaction {

class HoverTracker;
class ObjectRegistry;

// Walks a compiled hit list pair by pair until a handler stops propagation.
class EventDispatcher {
public:
    // Receives the freshly built with-intersection event for one pair.
    using Callback = std::function<void(const std::shared_ptr<InteractionEvent>& event)>;

    EventDispatcher(const ObjectRegistry& registry, HoverTracker& hoverTracker);

    // Stopping propagation on a hovered event object also blurs the hovered nodes
    // that are not hit, reporting the hits processed so far.
    void Dispatch(const HitResult& hits, const Controller& controller, const Callback& callback);

private:
    const ObjectRegistry& registry_;
    HoverTracker& hoverTracker_;
};

} // namespace Vireo::Interaction
