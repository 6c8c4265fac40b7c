#pragma once

#include "interaction/InteractionTypes.h"
#include <memory>
#include <unordered_set>
#include <vector>

namespace Vireo::Engine { class Scene; }

namespace Vireo::Interaction {

class ObjectRegistry;
class RayCaster;

// Flat (intersection, event object) list of one controller evaluation.
// Entry i pairs intersections[i] with eventObjects[i]; an intersection is
// repeated once per registered node on its ancestor chain.
struct HitResult {
    std::shared_ptr<const HitList> intersections = std::make_shared<const HitList>();
    std::vector<NodeId> eventObjects;
    std::unordered_set<NodeId> hitSet;

    size_t size() const { return eventObjects.size(); }
    bool empty() const { return eventObjects.empty(); }
    bool WasHit(NodeId node) const { return hitSet.count(node) > 0; }
    // Closest geometric hit, or nullptr.
    const Intersection* GetClosest() const;
};

// Walks from the hit node up to the root, nearest first, collecting every registered node.
std::vector<NodeId> ResolveEventObjects(const Engine::Scene& scene, const ObjectRegistry& registry, NodeId hitNode);

class HitCompiler {
public:
    HitCompiler(const Engine::Scene& scene, const ObjectRegistry& registry, const RayCaster& rayCaster);

    HitResult Compile(const Controller& controller) const;

private:
    const Engine::Scene& scene_;
    const ObjectRegistry& registry_;
    const RayCaster& rayCaster_;
};

} // namespace Vireo::Interaction
