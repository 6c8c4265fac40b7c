#ifndef VIREO_SCENE_H
#define VIREO_SCENE_H

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <glm/glm.hpp>
#include "engine/ray.h"
#include "engine/geometry/MeshBuffers.h"

namespace Vireo::Engine {

    class SceneNode;

    // Arena of scene nodes addressed by stable ids. Parent/child links are ids,
    // so anything outside the scene (registries, hover state) can key by id
    // without sharing ownership of the nodes.
    class Scene {
    public:
        Scene();
        ~Scene();

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;
        Scene(Scene&&) = default;
        Scene& operator=(Scene&&) = default;

        SceneNode* create_object(const std::string& name, uint64_t parentId = 0);
        SceneNode* create_mesh_object(const std::string& name, MeshBuffers mesh, uint64_t parentId = 0);
        SceneNode* get_object_by_id(uint64_t id);
        const SceneNode* get_object_by_id(uint64_t id) const;
        // Ordered by id (creation order).
        std::vector<SceneNode*> get_all_objects();
        std::vector<const SceneNode*> get_all_objects() const;
        size_t GetObjectCount() const;
        // Deletes the node and its whole subtree.
        void DeleteObject(uint64_t id);
        // Clears everything. Ids are not reused afterwards.
        void NewScene();

        // --- Hierarchy ---
        // parentId == 0 detaches the node. Rejects unknown ids and cycles.
        bool SetParent(uint64_t childId, uint64_t parentId);
        uint64_t GetParentId(uint64_t id) const;
        bool IsAncestorOf(uint64_t ancestorId, uint64_t nodeId) const;

        // --- Transforms ---
        // Sets the local transform and propagates world transforms through the subtree.
        bool SetLocalTransform(uint64_t id, const glm::mat4& transform);
        // Identity for unknown ids.
        glm::mat4 GetWorldTransform(uint64_t id) const;
        void UpdateWorldTransforms(uint64_t id);

        // --- Ray queries ---
        // Hits against the geometry of every root (and its descendants when recursive),
        // sorted by increasing distance. Each node is tested at most once.
        // Throws std::invalid_argument for a degenerate ray.
        std::vector<RayHit> IntersectObjects(const Ray& ray, const std::vector<uint64_t>& rootIds, bool recursive = true) const;
        std::vector<RayHit> IntersectObject(const Ray& ray, uint64_t rootId, bool recursive = true) const;

    private:
        std::unordered_map<uint64_t, std::unique_ptr<SceneNode>> objects_;
        uint64_t next_object_id_ = 1;

        void propagateWorldTransform(SceneNode& node, const glm::mat4& parentWorld);
        void collectSubtree(uint64_t id, bool recursive, std::vector<const SceneNode*>& out, std::unordered_set<uint64_t>& visited) const;
        void intersectNode(const SceneNode& node, const Ray& ray, std::vector<RayHit>& outHits) const;
        void detachFromParent(SceneNode& node);
    };

}

#endif // VIREO_SCENE_H
