#include "engine/scene.h"
#include "engine/scene_node.h"
#include "engine/geometry/MeshGeometry.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <glm/geometric.hpp>
#include <glm/matrix.hpp>

namespace {
    const float SINGULAR_DETERMINANT_TOLERANCE = 1e-12f;
}

namespace Vireo::Engine {

    Scene::Scene() {}

    Scene::~Scene() = default;

    SceneNode* Scene::create_object(const std::string& name, uint64_t parentId) {
        uint64_t new_id = next_object_id_++;
        auto result = objects_.emplace(new_id, std::make_unique<SceneNode>(new_id, name));
        if (!result.second) {
            std::cerr << "Scene: Failed to insert new object with ID " << new_id << " into map." << std::endl;
            next_object_id_--;
            return nullptr;
        }
        SceneNode* node = result.first->second.get();
        if (parentId != 0 && !SetParent(new_id, parentId)) {
            std::cerr << "Scene: Warning - '" << name << "' was created as a root because parent " << parentId << " is invalid." << std::endl;
        }
        return node;
    }

    SceneNode* Scene::create_mesh_object(const std::string& name, MeshBuffers mesh, uint64_t parentId) {
        SceneNode* node = create_object(name, parentId);
        if (!node) {
            return nullptr;
        }
        if (mesh.isEmpty()) {
            std::cerr << "Scene: Warning - Mesh for '" << name << "' is empty." << std::endl;
        }
        node->setGeometry(std::make_unique<MeshGeometry>(std::move(mesh)));
        return node;
    }

    SceneNode* Scene::get_object_by_id(uint64_t id) {
        auto it = objects_.find(id);
        if (it != objects_.end()) {
            return it->second.get();
        }
        return nullptr;
    }

    const SceneNode* Scene::get_object_by_id(uint64_t id) const {
        auto it = objects_.find(id);
        if (it != objects_.end()) {
            return it->second.get();
        }
        return nullptr;
    }

    std::vector<SceneNode*> Scene::get_all_objects() {
        std::vector<SceneNode*> result;
        result.reserve(objects_.size());
        for (auto const& [id, obj_ptr] : objects_) {
            result.push_back(obj_ptr.get());
        }
        std::sort(result.begin(), result.end(), [](const SceneNode* a, const SceneNode* b) { return a->get_id() < b->get_id(); });
        return result;
    }

    std::vector<const SceneNode*> Scene::get_all_objects() const {
        std::vector<const SceneNode*> result;
        result.reserve(objects_.size());
        for (auto const& [id, obj_ptr] : objects_) {
            result.push_back(obj_ptr.get());
        }
        std::sort(result.begin(), result.end(), [](const SceneNode* a, const SceneNode* b) { return a->get_id() < b->get_id(); });
        return result;
    }

    size_t Scene::GetObjectCount() const {
        return objects_.size();
    }

    void Scene::DeleteObject(uint64_t id) {
        SceneNode* node = get_object_by_id(id);
        if (!node) {
            return;
        }
        detachFromParent(*node);

        // Collect the subtree first, then erase, so that no child list is read after its owner is gone.
        std::vector<uint64_t> toDelete;
        std::vector<uint64_t> stack = { id };
        while (!stack.empty()) {
            uint64_t current = stack.back();
            stack.pop_back();
            const SceneNode* currentNode = get_object_by_id(current);
            if (!currentNode) continue;
            toDelete.push_back(current);
            for (uint64_t childId : currentNode->getChildIds()) {
                stack.push_back(childId);
            }
        }
        for (uint64_t deadId : toDelete) {
            objects_.erase(deadId);
        }
    }

    void Scene::NewScene() {
        objects_.clear();
    }

    void Scene::detachFromParent(SceneNode& node) {
        if (node.parentId_ == 0) {
            return;
        }
        if (SceneNode* parent = get_object_by_id(node.parentId_)) {
            auto& siblings = parent->childIds_;
            siblings.erase(std::remove(siblings.begin(), siblings.end(), node.id_), siblings.end());
        }
        node.parentId_ = 0;
    }

    bool Scene::SetParent(uint64_t childId, uint64_t parentId) {
        SceneNode* child = get_object_by_id(childId);
        if (!child) {
            std::cerr << "Scene: SetParent failed, object " << childId << " not found." << std::endl;
            return false;
        }
        if (parentId == childId || (parentId != 0 && IsAncestorOf(childId, parentId))) {
            std::cerr << "Scene: SetParent rejected, " << parentId << " would create a cycle under " << childId << "." << std::endl;
            return false;
        }
        SceneNode* parent = nullptr;
        if (parentId != 0) {
            parent = get_object_by_id(parentId);
            if (!parent) {
                std::cerr << "Scene: SetParent failed, parent " << parentId << " not found." << std::endl;
                return false;
            }
        }

        detachFromParent(*child);
        if (parent) {
            child->parentId_ = parentId;
            parent->childIds_.push_back(childId);
        }
        UpdateWorldTransforms(childId);
        return true;
    }

    uint64_t Scene::GetParentId(uint64_t id) const {
        const SceneNode* node = get_object_by_id(id);
        return node ? node->getParentId() : 0;
    }

    bool Scene::IsAncestorOf(uint64_t ancestorId, uint64_t nodeId) const {
        const SceneNode* node = get_object_by_id(nodeId);
        while (node && node->getParentId() != 0) {
            if (node->getParentId() == ancestorId) {
                return true;
            }
            node = get_object_by_id(node->getParentId());
        }
        return false;
    }

    bool Scene::SetLocalTransform(uint64_t id, const glm::mat4& transform) {
        SceneNode* node = get_object_by_id(id);
        if (!node) {
            std::cerr << "Scene: SetLocalTransform failed, object " << id << " not found." << std::endl;
            return false;
        }
        node->transform_ = transform;
        UpdateWorldTransforms(id);
        return true;
    }

    glm::mat4 Scene::GetWorldTransform(uint64_t id) const {
        const SceneNode* node = get_object_by_id(id);
        return node ? node->getWorldTransform() : glm::mat4(1.0f);
    }

    void Scene::UpdateWorldTransforms(uint64_t id) {
        SceneNode* node = get_object_by_id(id);
        if (!node) {
            return;
        }
        glm::mat4 parentWorld(1.0f);
        if (const SceneNode* parent = get_object_by_id(node->getParentId())) {
            parentWorld = parent->getWorldTransform();
        }
        propagateWorldTransform(*node, parentWorld);
    }

    void Scene::propagateWorldTransform(SceneNode& node, const glm::mat4& parentWorld) {
        node.worldTransform_ = parentWorld * node.transform_;
        for (uint64_t childId : node.childIds_) {
            if (SceneNode* child = get_object_by_id(childId)) {
                propagateWorldTransform(*child, node.worldTransform_);
            }
        }
    }

    void Scene::collectSubtree(uint64_t id, bool recursive, std::vector<const SceneNode*>& out, std::unordered_set<uint64_t>& visited) const {
        const SceneNode* node = get_object_by_id(id);
        if (!node || !visited.insert(id).second) {
            return;
        }
        out.push_back(node);
        if (!recursive) {
            return;
        }
        for (uint64_t childId : node->getChildIds()) {
            collectSubtree(childId, true, out, visited);
        }
    }

    void Scene::intersectNode(const SceneNode& node, const Ray& ray, std::vector<RayHit>& outHits) const {
        const IGeometry* geometry = node.getGeometry();
        if (!geometry) {
            return;
        }
        const glm::mat4& world = node.getWorldTransform();
        if (std::abs(glm::determinant(world)) < SINGULAR_DETERMINANT_TOLERANCE) {
            return; // Collapsed by a zero scale, nothing to hit
        }
        const glm::mat4 inverseWorld = glm::inverse(world);
        const glm::mat3 normalMatrix = glm::transpose(glm::mat3(inverseWorld));

        glm::vec3 localOrigin = glm::vec3(inverseWorld * glm::vec4(ray.origin, 1.0f));
        glm::vec3 localDirection = glm::mat3(inverseWorld) * ray.direction;

        std::vector<LocalHit> localHits;
        if (!geometry->Raycast(localOrigin, localDirection, localHits)) {
            return;
        }
        for (const auto& localHit : localHits) {
            RayHit hit;
            hit.objectId = node.get_id();
            hit.point = glm::vec3(world * glm::vec4(localHit.point, 1.0f));
            hit.distance = glm::length(hit.point - ray.origin);
            hit.normal = glm::normalize(normalMatrix * localHit.normal);
            hit.triangleIndex = localHit.triangleIndex;
            if (hit.distance < ray.nearDistance || hit.distance > ray.farDistance) {
                continue;
            }
            outHits.push_back(hit);
        }
    }

    std::vector<RayHit> Scene::IntersectObjects(const Ray& ray, const std::vector<uint64_t>& rootIds, bool recursive) const {
        if (!IsValidRay(ray)) {
            throw std::invalid_argument("Scene: IntersectObjects called with a degenerate ray");
        }

        std::vector<const SceneNode*> candidates;
        std::unordered_set<uint64_t> visited;
        for (uint64_t rootId : rootIds) {
            collectSubtree(rootId, recursive, candidates, visited);
        }

        std::vector<RayHit> hits;
        for (const SceneNode* node : candidates) {
            intersectNode(*node, ray, hits);
        }
        std::stable_sort(hits.begin(), hits.end(), [](const RayHit& a, const RayHit& b) { return a.distance < b.distance; });
        return hits;
    }

    std::vector<RayHit> Scene::IntersectObject(const Ray& ray, uint64_t rootId, bool recursive) const {
        return IntersectObjects(ray, { rootId }, recursive);
    }

} // namespace Vireo::Engine
