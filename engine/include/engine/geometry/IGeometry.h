#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <vector>

namespace Vireo::Engine {

    // A hit expressed in the geometry's local space. The scene converts it to world space.
    struct LocalHit {
        glm::vec3 point = glm::vec3(0.0f);
        glm::vec3 normal = glm::vec3(0.0f);
        size_t triangleIndex = 0;
    };

    // Abstract base class for all geometry types that a scene node can own.
    class IGeometry {
    public:
        virtual ~IGeometry() = default;

        // Appends every hit of the local-space ray to outHits. Returns true if anything was hit.
        virtual bool Raycast(const glm::vec3& localOrigin, const glm::vec3& localDirection, std::vector<LocalHit>& outHits) const = 0;

        // Axis-aligned bounds in local space. Returns false for empty geometry.
        virtual bool getLocalBounds(glm::vec3& outMin, glm::vec3& outMax) const = 0;
    };

} // namespace Vireo::Engine
