#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace Vireo::Engine {

    struct Ray {
        glm::vec3 origin = glm::vec3(0.0f);
        glm::vec3 direction = glm::vec3(0.0f, 0.0f, -1.0f); // Expected to be normalized
        float nearDistance = 0.0f;
        float farDistance = std::numeric_limits<float>::infinity();

        glm::vec3 at(float t) const { return origin + direction * t; }
    };

    // One geometric hit returned by Scene::IntersectObjects. All values are in world space.
    struct RayHit {
        uint64_t objectId = 0;   // The node owning the hit geometry
        float distance = 0.0f;   // Distance from the ray origin
        glm::vec3 point = glm::vec3(0.0f);
        glm::vec3 normal = glm::vec3(0.0f);
        size_t triangleIndex = 0; // Base index of the hit triangle in the mesh index buffer
    };

    // Moller-Trumbore, double-sided. t_intersection is the ray parameter of the hit.
    bool RayTriangleIntersect(
        const glm::vec3& rayOrigin, const glm::vec3& rayDirection,
        const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2,
        float& t_intersection
    );

    // Slab test. t_intersect is the entry parameter (may be negative if the origin is inside the box).
    bool RayAABBIntersect(
        const glm::vec3& rayOrigin, const glm::vec3& rayDir,
        const glm::vec3& boxMin, const glm::vec3& boxMax,
        float& t_intersect
    );

    // True when the ray can be used for intersection queries: finite origin and a finite, non-zero direction.
    bool IsValidRay(const Ray& ray);

} // namespace Vireo::Engine
