#pragma once

#include "interaction/InteractionTypes.h"
#include <array>
#include <memory>
#include <unordered_map>
#include <vector>

namespace Vireo::Interaction {

// Which scene nodes are interaction targets, and their handlers per interaction type.
// A node is present only while it has at least one handler.
class ObjectRegistry {
public:
    ObjectRegistry() = default;
    ObjectRegistry(const ObjectRegistry&) = delete;
    ObjectRegistry& operator=(const ObjectRegistry&) = delete;

    HandlerId Add(NodeId node, InteractionType type, InteractionHandler handler);
    // Returns false when the handler was not registered. Unknown ids are ignored.
    bool Remove(NodeId node, InteractionType type, HandlerId handlerId);

    bool Has(NodeId node) const;
    bool Has(NodeId node, InteractionType type) const;
    size_t GetHandlerCount(NodeId node, InteractionType type) const;
    bool IsEmpty() const { return entries_.empty(); }
    size_t Size() const { return entries_.size(); }

    // Registered nodes in registration order.
    const std::vector<NodeId>& GetNodes() const { return order_; }

    // Calls the node's handlers of the given type in registration order.
    // Handlers removed while this runs are skipped; handlers added while this runs wait for the next call.
    void Invoke(NodeId node, InteractionType type, InteractionEvent& event) const;

private:
    struct HandlerEntry {
        HandlerId id = 0;
        InteractionHandler handler;
        bool active = true;
    };

    using HandlerList = std::vector<std::shared_ptr<HandlerEntry>>;

    struct NodeEntry {
        std::array<HandlerList, INTERACTION_TYPE_COUNT> handlers;

        bool isEmpty() const;
    };

    std::unordered_map<NodeId, NodeEntry> entries_;
    std::vector<NodeId> order_;
    HandlerId nextHandlerId_ = 1;
};

} // namespace Vireo::Interaction
