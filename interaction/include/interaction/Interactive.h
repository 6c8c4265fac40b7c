#pragma once

#include "interaction/InteractionTypes.h"
#include <functional>
#include <vector>

namespace Vireo::Interaction {

class InteractionManager;

using WithIntersectionHandler = std::function<void(InteractionWithIntersectionEvent&)>;
using NoIntersectionHandler = std::function<void(const InteractionNoIntersectionEvent&)>;

// Adapts a typed handler to the registry's variant handler. Events of the other family are ignored.
InteractionHandler MakeHandler(WithIntersectionHandler handler);
InteractionHandler MakeHandler(NoIntersectionHandler handler);

// Registration of one handler on one node, removed again on destruction.
class InteractionBinding {
public:
    InteractionBinding() = default;
    // A null manager or an empty handler leaves the binding unbound.
    InteractionBinding(InteractionManager* manager, NodeId node, InteractionType type, InteractionHandler handler);
    ~InteractionBinding();

    InteractionBinding(const InteractionBinding&) = delete;
    InteractionBinding& operator=(const InteractionBinding&) = delete;
    InteractionBinding(InteractionBinding&& other) noexcept;
    InteractionBinding& operator=(InteractionBinding&& other) noexcept;

    void Reset();
    bool IsBound() const { return manager_ != nullptr; }
    NodeId GetNode() const { return node_; }
    InteractionType GetType() const { return type_; }

private:
    InteractionManager* manager_ = nullptr;
    NodeId node_ = 0;
    InteractionType type_ = InteractionType::Hover;
    HandlerId handlerId_ = 0;
};

struct InteractiveHandlers {
    WithIntersectionHandler onHover;
    NoIntersectionHandler onBlur;
    WithIntersectionHandler onSelectStart;
    WithIntersectionHandler onSelectEnd;
    WithIntersectionHandler onSelect;
    WithIntersectionHandler onSqueezeStart;
    WithIntersectionHandler onSqueezeEnd;
    WithIntersectionHandler onSqueeze;
    NoIntersectionHandler onSelectMissed;
};

// Binds every non-empty slot of an InteractiveHandlers to a node.
class Interactive {
public:
    Interactive() = default;
    Interactive(InteractionManager* manager, NodeId node, const InteractiveHandlers& handlers);

    Interactive(const Interactive&) = delete;
    Interactive& operator=(const Interactive&) = delete;
    Interactive(Interactive&&) noexcept = default;
    Interactive& operator=(Interactive&&) noexcept = default;

    void Reset();
    NodeId GetNode() const { return node_; }
    size_t GetBoundSlotCount() const { return bindings_.size(); }

private:
    void bind(InteractionManager* manager, InteractionType type, InteractionHandler handler);

    NodeId node_ = 0;
    std::vector<InteractionBinding> bindings_;
};

} // namespace Vireo::Interaction
