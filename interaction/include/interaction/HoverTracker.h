#pragma once

#include "interaction/InteractionTypes.h"
#include <array>
#include <memory>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Vireo::Interaction {

class ObjectRegistry;

// Per handedness: which nodes are hovered, the hover event each one entered with,
// and the closest intersection of the last evaluation.
class HoverTracker {
public:
    // The stored event is shared with the dispatch pass that created it, so a
    // StopPropagation call made by an onHover handler is visible here.
    using HoverRecord = std::shared_ptr<InteractionEvent>;

    HoverTracker() = default;

    bool IsHovered(Handedness handedness, NodeId node) const;
    HoverRecord GetRecord(Handedness handedness, NodeId node) const;
    // Returns true when the record was stored. A node keeps its first record until it leaves.
    bool AddRecord(Handedness handedness, NodeId node, HoverRecord record);
    bool RemoveRecord(Handedness handedness, NodeId node);
    // Purges the node from every handedness, including the closest-hit bookkeeping.
    void Purge(NodeId node);
    void ClearClosestIfObject(NodeId node);
    void Clear();

    // Hovered nodes in the order they entered.
    std::vector<NodeId> GetHoveredNodes(Handedness handedness) const;
    size_t GetHoveredCount(Handedness handedness) const;

    const std::optional<Intersection>& GetClosest(Handedness handedness) const;
    void SetClosest(Handedness handedness, const Intersection* closest);

    // Blurs every hovered node of the controller's handedness that is not in hitSet:
    // its onBlur handlers get the given intersection list, then it leaves the hover set.
    void CancelHover(const ObjectRegistry& registry, const Controller& controller,
                     const std::shared_ptr<const HitList>& intersections,
                     const std::unordered_set<NodeId>& hitSet);

private:
    struct HandState {
        std::vector<std::pair<NodeId, HoverRecord>> hovering;
        std::optional<Intersection> closest;
    };

    HandState& hand(Handedness handedness) { return hands_[ToIndex(handedness)]; }
    const HandState& hand(Handedness handedness) const { return hands_[ToIndex(handedness)]; }

    std::array<HandState, HANDEDNESS_COUNT> hands_;
};

} // namespace Vireo::Interaction
