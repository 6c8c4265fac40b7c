#include "interaction/Interactive.h"
#include "interaction/InteractionManager.h"
#include <iostream>
#include <utility>

namespace Vireo::Interaction {

namespace {
    void WarnNoContext(NodeId node) {
        std::cerr << "Interactive: Warning! No interaction context for node " << node
                  << ", handlers are not registered." << std::endl;
    }
}

InteractionHandler MakeHandler(WithIntersectionHandler handler) {
    if (!handler) return nullptr;
    return [handler = std::move(handler)](InteractionEvent& event) {
        if (auto* withHit = std::get_if<InteractionWithIntersectionEvent>(&event)) {
            handler(*withHit);
        }
    };
}

InteractionHandler MakeHandler(NoIntersectionHandler handler) {
    if (!handler) return nullptr;
    return [handler = std::move(handler)](InteractionEvent& event) {
        if (const auto* noHit = std::get_if<InteractionNoIntersectionEvent>(&event)) {
            handler(*noHit);
        }
    };
}

InteractionBinding::InteractionBinding(InteractionManager* manager, NodeId node, InteractionType type, InteractionHandler handler)
    : node_(node), type_(type)
{
    if (!manager) {
        WarnNoContext(node);
        return;
    }
    if (!handler) {
        return;
    }
    manager_ = manager;
    handlerId_ = manager_->AddInteraction(node_, type_, std::move(handler));
}

InteractionBinding::~InteractionBinding() {
    Reset();
}

InteractionBinding::InteractionBinding(InteractionBinding&& other) noexcept
    : manager_(std::exchange(other.manager_, nullptr)),
      node_(other.node_),
      type_(other.type_),
      handlerId_(std::exchange(other.handlerId_, 0)) {}

InteractionBinding& InteractionBinding::operator=(InteractionBinding&& other) noexcept {
    if (this != &other) {
        Reset();
        manager_ = std::exchange(other.manager_, nullptr);
        node_ = other.node_;
        type_ = other.type_;
        handlerId_ = std::exchange(other.handlerId_, 0);
    }
    return *this;
}

void InteractionBinding::Reset() {
    if (manager_) {
        manager_->RemoveInteraction(node_, type_, handlerId_);
        manager_ = nullptr;
        handlerId_ = 0;
    }
}

Interactive::Interactive(InteractionManager* manager, NodeId node, const InteractiveHandlers& handlers)
    : node_(node)
{
    if (!manager) {
        WarnNoContext(node);
        return;
    }
    bind(manager, InteractionType::Hover, MakeHandler(handlers.onHover));
    bind(manager, InteractionType::Blur, MakeHandler(handlers.onBlur));
    bind(manager, InteractionType::SelectStart, MakeHandler(handlers.onSelectStart));
    bind(manager, InteractionType::SelectEnd, MakeHandler(handlers.onSelectEnd));
    bind(manager, InteractionType::Select, MakeHandler(handlers.onSelect));
    bind(manager, InteractionType::SqueezeStart, MakeHandler(handlers.onSqueezeStart));
    bind(manager, InteractionType::SqueezeEnd, MakeHandler(handlers.onSqueezeEnd));
    bind(manager, InteractionType::Squeeze, MakeHandler(handlers.onSqueeze));
    bind(manager, InteractionType::SelectMissed, MakeHandler(handlers.onSelectMissed));
}

void Interactive::Reset() {
    // Last registered slot goes first.
    while (!bindings_.empty()) {
        bindings_.pop_back();
    }
}

void Interactive::bind(InteractionManager* manager, InteractionType type, InteractionHandler handler) {
    if (!handler) return;
    bindings_.emplace_back(manager, node_, type, std::move(handler));
}

} // namespace Vireo::Interaction
