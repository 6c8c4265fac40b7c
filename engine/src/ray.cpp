#include "engine/ray.h"
#include <glm/geometric.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace {
    const float EPSILON_INTERSECT = 1e-6f;
    const float PARALLEL_EPSILON = 1e-8f;

    bool IsFinite(const glm::vec3& v) {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }
}

namespace Vireo::Engine {

    bool RayTriangleIntersect(
        const glm::vec3& rayOrigin, const glm::vec3& rayDirection,
        const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2,
        float& t_intersection
    ) {
        glm::vec3 edge1 = v1 - v0;
        glm::vec3 edge2 = v2 - v0;
        glm::vec3 h = glm::cross(rayDirection, edge2);
        float a = glm::dot(edge1, h);
        if (a > -EPSILON_INTERSECT && a < EPSILON_INTERSECT) return false;
        float f = 1.0f / a;
        glm::vec3 s = rayOrigin - v0;
        float u = f * glm::dot(s, h);
        if (u < 0.0f || u > 1.0f) return false;
        glm::vec3 q = glm::cross(s, edge1);
        float v = f * glm::dot(rayDirection, q);
        if (v < 0.0f || u + v > 1.0f) return false;
        t_intersection = f * glm::dot(edge2, q);
        return t_intersection > EPSILON_INTERSECT;
    }

    bool RayAABBIntersect(
        const glm::vec3& rayOrigin, const glm::vec3& rayDir,
        const glm::vec3& boxMin, const glm::vec3& boxMax,
        float& t_intersect)
    {
        float tmin = -std::numeric_limits<float>::infinity();
        float tmax = std::numeric_limits<float>::infinity();

        for (int i = 0; i < 3; ++i) {
            if (std::abs(rayDir[i]) < PARALLEL_EPSILON) { // Parallel to the slab
                if (rayOrigin[i] < boxMin[i] || rayOrigin[i] > boxMax[i]) {
                    return false;
                }
                continue;
            }
            float ood = 1.0f / rayDir[i];
            float t1 = (boxMin[i] - rayOrigin[i]) * ood;
            float t2 = (boxMax[i] - rayOrigin[i]) * ood;
            if (t1 > t2) std::swap(t1, t2);
            tmin = std::max(tmin, t1);
            tmax = std::min(tmax, t2);
            if (tmin > tmax) {
                return false;
            }
        }
        if (tmax < 0.0f) {
            return false; // Box is behind the origin
        }
        t_intersect = tmin;
        return true;
    }

    bool IsValidRay(const Ray& ray) {
        if (!IsFinite(ray.origin) || !IsFinite(ray.direction)) {
            return false;
        }
        return glm::dot(ray.direction, ray.direction) > EPSILON_INTERSECT * EPSILON_INTERSECT;
    }

} // namespace Vireo::Engine
