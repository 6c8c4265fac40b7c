#include "interaction/HitCompiler.h"
#include "interaction/ObjectRegistry.h"
#include "interaction/RayCaster.h"
#include "engine/scene.h"

namespace Vireo::Interaction {

const Intersection* HitResult::GetClosest() const {
    if (!intersections || intersections->empty()) return nullptr;
    return &intersections->front();
}

std::vector<NodeId> ResolveEventObjects(const Engine::Scene& scene, const ObjectRegistry& registry, NodeId hitNode) {
    std::vector<NodeId> eventObjects;
    NodeId current = hitNode;
    while (current != 0 && scene.get_object_by_id(current)) {
        if (registry.Has(current)) {
            eventObjects.push_back(current);
        }
        current = scene.GetParentId(current);
    }
    return eventObjects;
}

HitCompiler::HitCompiler(const Engine::Scene& scene, const ObjectRegistry& registry, const RayCaster& rayCaster)
    : scene_(scene), registry_(registry), rayCaster_(rayCaster) {}

HitResult HitCompiler::Compile(const Controller& controller) const {
    HitResult result;
    if (registry_.IsEmpty()) {
        return result;
    }

    HitList rawHits = rayCaster_.Cast(controller, registry_.GetNodes());
    HitList flat;
    for (const auto& hit : rawHits) {
        for (NodeId eventObject : ResolveEventObjects(scene_, registry_, hit.objectId)) {
            flat.push_back(hit);
            result.eventObjects.push_back(eventObject);
            result.hitSet.insert(eventObject);
        }
    }
    result.intersections = std::make_shared<const HitList>(std::move(flat));
    return result;
}

} // namespace Vireo::Interaction
