#include "engine/scene_node.h"
#include <utility>

namespace Vireo::Engine {

    SceneNode::SceneNode(uint64_t id, std::string name)
        : id_(id), name_(std::move(name)) {
    }

    SceneNode::~SceneNode() = default;

    SceneNode::SceneNode(SceneNode&& other) noexcept
        : id_(other.id_),
        name_(std::move(other.name_)),
        parentId_(other.parentId_),
        childIds_(std::move(other.childIds_)),
        transform_(other.transform_),
        worldTransform_(other.worldTransform_),
        geometry_(std::move(other.geometry_))
    {
        other.id_ = 0;
        other.parentId_ = 0;
    }

    SceneNode& SceneNode::operator=(SceneNode&& other) noexcept {
        if (this != &other) {
            id_ = other.id_;
            name_ = std::move(other.name_);
            parentId_ = other.parentId_;
            childIds_ = std::move(other.childIds_);
            transform_ = other.transform_;
            worldTransform_ = other.worldTransform_;
            geometry_ = std::move(other.geometry_);
            other.id_ = 0;
            other.parentId_ = 0;
        }
        return *this;
    }

    uint64_t SceneNode::get_id() const { return id_; }
    const std::string& SceneNode::get_name() const { return name_; }
    void SceneNode::set_name(const std::string& name) { name_ = name; }

    const glm::mat4& SceneNode::getTransform() const {
        return transform_;
    }

    const glm::mat4& SceneNode::getWorldTransform() const {
        return worldTransform_;
    }

    std::unique_ptr<IGeometry> SceneNode::setGeometry(std::unique_ptr<IGeometry> geometry) {
        std::unique_ptr<IGeometry> previous = std::move(geometry_);
        geometry_ = std::move(geometry);
        return previous;
    }

    IGeometry* SceneNode::getGeometry() const {
        return geometry_.get();
    }

    bool SceneNode::hasGeometry() const {
        return geometry_ != nullptr;
    }

} // namespace Vireo::Engine
