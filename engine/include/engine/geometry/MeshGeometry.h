#pragma once

#include "engine/geometry/IGeometry.h"
#include "engine/geometry/MeshBuffers.h"

namespace Vireo::Engine {

    // Concrete implementation of IGeometry for objects that are only defined
    // by their triangle mesh.
    class MeshGeometry : public IGeometry {
    public:
        // Takes ownership of the mesh buffers.
        explicit MeshGeometry(MeshBuffers mesh, bool doubleSided = false);
        ~MeshGeometry() override;

        // Movable, but not copyable.
        MeshGeometry(const MeshGeometry&) = delete;
        MeshGeometry& operator=(const MeshGeometry&) = delete;
        MeshGeometry(MeshGeometry&&) = default;
        MeshGeometry& operator=(MeshGeometry&&) = default;

        bool Raycast(const glm::vec3& localOrigin, const glm::vec3& localDirection, std::vector<LocalHit>& outHits) const override;
        bool getLocalBounds(glm::vec3& outMin, glm::vec3& outMax) const override;

        const MeshBuffers& getMesh() const;
        bool isDoubleSided() const { return doubleSided_; }
        void setDoubleSided(bool doubleSided) { doubleSided_ = doubleSided; }

    private:
        void computeBounds();

        MeshBuffers mesh_;
        bool doubleSided_ = false;
        glm::vec3 aabbMin_ = glm::vec3(0.0f);
        glm::vec3 aabbMax_ = glm::vec3(0.0f);
        bool aabbValid_ = false;
    };

} // namespace Vireo::Engine
