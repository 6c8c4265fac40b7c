#include "interaction/HoverTracker.h"
#include "interaction/ObjectRegistry.h"
#include <algorithm>

namespace Vireo::Interaction {

namespace {
    using HoverEntries = std::vector<std::pair<NodeId, HoverTracker::HoverRecord>>;

    HoverEntries::const_iterator FindEntry(const HoverEntries& entries, NodeId node) {
        return std::find_if(entries.begin(), entries.end(),
            [node](const HoverEntries::value_type& e) { return e.first == node; });
    }
}

bool HoverTracker::IsHovered(Handedness handedness, NodeId node) const {
    const auto& entries = hand(handedness).hovering;
    return FindEntry(entries, node) != entries.end();
}

HoverTracker::HoverRecord HoverTracker::GetRecord(Handedness handedness, NodeId node) const {
    const auto& entries = hand(handedness).hovering;
    auto it = FindEntry(entries, node);
    return it != entries.end() ? it->second : nullptr;
}

bool HoverTracker::AddRecord(Handedness handedness, NodeId node, HoverRecord record) {
    if (IsHovered(handedness, node)) {
        return false;
    }
    hand(handedness).hovering.emplace_back(node, std::move(record));
    return true;
}

bool HoverTracker::RemoveRecord(Handedness handedness, NodeId node) {
    auto& entries = hand(handedness).hovering;
    auto it = FindEntry(entries, node);
    if (it == entries.end()) {
        return false;
    }
    entries.erase(it);
    return true;
}

void HoverTracker::Purge(NodeId node) {
    for (size_t i = 0; i < HANDEDNESS_COUNT; ++i) {
        RemoveRecord(static_cast<Handedness>(i), node);
    }
    ClearClosestIfObject(node);
}

void HoverTracker::ClearClosestIfObject(NodeId node) {
    for (auto& state : hands_) {
        if (state.closest && state.closest->objectId == node) {
            state.closest.reset();
        }
    }
}

void HoverTracker::Clear() {
    for (auto& state : hands_) {
        state.hovering.clear();
        state.closest.reset();
    }
}

std::vector<NodeId> HoverTracker::GetHoveredNodes(Handedness handedness) const {
    std::vector<NodeId> nodes;
    for (const auto& entry : hand(handedness).hovering) {
        nodes.push_back(entry.first);
    }
    return nodes;
}

size_t HoverTracker::GetHoveredCount(Handedness handedness) const {
    return hand(handedness).hovering.size();
}

const std::optional<Intersection>& HoverTracker::GetClosest(Handedness handedness) const {
    return hand(handedness).closest;
}

void HoverTracker::SetClosest(Handedness handedness, const Intersection* closest) {
    if (closest) {
        hand(handedness).closest = *closest;
    } else {
        hand(handedness).closest.reset();
    }
}

void HoverTracker::CancelHover(const ObjectRegistry& registry, const Controller& controller,
                               const std::shared_ptr<const HitList>& intersections,
                               const std::unordered_set<NodeId>& hitSet) {
    const Handedness handedness = controller.handedness;
    // onBlur handlers may unregister nodes, which purges them from the live map.
    for (NodeId node : GetHoveredNodes(handedness)) {
        if (hitSet.count(node) > 0 || !IsHovered(handedness, node)) {
            continue;
        }

        if (registry.Has(node, InteractionType::Blur)) {
            InteractionNoIntersectionEvent blur;
            blur.eventObject = node;
            blur.controller = controller;
            blur.intersections = intersections;
            InteractionEvent event = blur;
            registry.Invoke(node, InteractionType::Blur, event);
        }

        RemoveRecord(handedness, node);
        auto& closest = hand(handedness).closest;
        if (closest && closest->objectId == node) {
            closest.reset();
        }
    }
}

} // namespace Vireo::Interaction
