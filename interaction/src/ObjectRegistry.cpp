#include "interaction/ObjectRegistry.h"
#include <algorithm>

namespace Vireo::Interaction {

namespace {
    size_t SlotOf(InteractionType type) {
        return static_cast<size_t>(type);
    }
}

bool ObjectRegistry::NodeEntry::isEmpty() const {
    for (const auto& list : handlers) {
        if (!list.empty()) return false;
    }
    return true;
}

HandlerId ObjectRegistry::Add(NodeId node, InteractionType type, InteractionHandler handler) {
    auto it = entries_.find(node);
    if (it == entries_.end()) {
        it = entries_.emplace(node, NodeEntry()).first;
        order_.push_back(node);
    }

    auto entry = std::make_shared<HandlerEntry>();
    entry->id = nextHandlerId_++;
    entry->handler = std::move(handler);
    it->second.handlers[SlotOf(type)].push_back(entry);
    return entry->id;
}

bool ObjectRegistry::Remove(NodeId node, InteractionType type, HandlerId handlerId) {
    auto it = entries_.find(node);
    if (it == entries_.end()) {
        return false;
    }

    HandlerList& list = it->second.handlers[SlotOf(type)];
    auto handlerIt = std::find_if(list.begin(), list.end(),
        [handlerId](const std::shared_ptr<HandlerEntry>& e) { return e->id == handlerId; });
    if (handlerIt == list.end()) {
        return false;
    }
    (*handlerIt)->active = false;
    list.erase(handlerIt);

    if (it->second.isEmpty()) {
        entries_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), node), order_.end());
    }
    return true;
}

bool ObjectRegistry::Has(NodeId node) const {
    return entries_.count(node) > 0;
}

bool ObjectRegistry::Has(NodeId node, InteractionType type) const {
    return GetHandlerCount(node, type) > 0;
}

size_t ObjectRegistry::GetHandlerCount(NodeId node, InteractionType type) const {
    auto it = entries_.find(node);
    if (it == entries_.end()) return 0;
    return it->second.handlers[SlotOf(type)].size();
}

void ObjectRegistry::Invoke(NodeId node, InteractionType type, InteractionEvent& event) const {
    auto it = entries_.find(node);
    if (it == entries_.end()) return;

    const HandlerList snapshot = it->second.handlers[SlotOf(type)];
    for (const auto& entry : snapshot) {
        if (!entry->active) continue;
        entry->handler(event);
    }
}

} // namespace Vireo::Interaction
