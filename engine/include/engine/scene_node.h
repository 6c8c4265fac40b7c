#ifndef VIREO_SCENE_NODE_H
#define VIREO_SCENE_NODE_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "engine/geometry/IGeometry.h"

namespace Vireo::Engine {

    class Scene;

    // One element of the scene graph. Nodes are owned by their Scene and refer to
    // each other by id only; the parent link is never an owning pointer.
    class SceneNode {
    public:
        SceneNode(uint64_t id, std::string name);
        ~SceneNode();

        SceneNode(const SceneNode&) = delete;
        SceneNode& operator=(const SceneNode&) = delete;
        SceneNode(SceneNode&&) noexcept;
        SceneNode& operator=(SceneNode&&) noexcept;

        uint64_t get_id() const;
        const std::string& get_name() const;
        void set_name(const std::string& name);

        // 0 when the node is a root.
        uint64_t getParentId() const { return parentId_; }
        const std::vector<uint64_t>& getChildIds() const { return childIds_; }

        // Local transform relative to the parent. Use Scene::SetLocalTransform to
        // change it so that world transforms stay in sync.
        const glm::mat4& getTransform() const;
        const glm::mat4& getWorldTransform() const;

        std::unique_ptr<IGeometry> setGeometry(std::unique_ptr<IGeometry> geometry);
        IGeometry* getGeometry() const;
        bool hasGeometry() const;

    private:
        friend class Scene;

        uint64_t id_;
        std::string name_;
        uint64_t parentId_ = 0;
        std::vector<uint64_t> childIds_;
        glm::mat4 transform_ = glm::mat4(1.0f);
        glm::mat4 worldTransform_ = glm::mat4(1.0f);
        std::unique_ptr<IGeometry> geometry_ = nullptr;
    };

} // namespace Vireo::Engine

#endif // VIREO_SCENE_NODE_H
