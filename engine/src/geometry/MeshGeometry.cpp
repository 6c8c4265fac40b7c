#include "engine/geometry/MeshGeometry.h"
#include "engine/ray.h"
#include <glm/geometric.hpp>
#include <algorithm>
#include <limits>
#include <utility>

namespace {
    const float SHARED_EDGE_EPSILON = 1e-5f;
    const float COPLANAR_COS = 0.9999f;
}

namespace Vireo::Engine {

    MeshGeometry::MeshGeometry(MeshBuffers mesh, bool doubleSided)
        : mesh_(std::move(mesh)), doubleSided_(doubleSided) {
        computeBounds();
    }

    MeshGeometry::~MeshGeometry() = default;

    void MeshGeometry::computeBounds() {
        aabbValid_ = false;
        if (mesh_.vertices.empty()) {
            return;
        }
        aabbMin_ = glm::vec3(std::numeric_limits<float>::max());
        aabbMax_ = glm::vec3(std::numeric_limits<float>::lowest());
        for (size_t i = 0; i + 2 < mesh_.vertices.size(); i += 3) {
            aabbMin_.x = std::min(aabbMin_.x, mesh_.vertices[i]);
            aabbMin_.y = std::min(aabbMin_.y, mesh_.vertices[i+1]);
            aabbMin_.z = std::min(aabbMin_.z, mesh_.vertices[i+2]);
            aabbMax_.x = std::max(aabbMax_.x, mesh_.vertices[i]);
            aabbMax_.y = std::max(aabbMax_.y, mesh_.vertices[i+1]);
            aabbMax_.z = std::max(aabbMax_.z, mesh_.vertices[i+2]);
        }
        aabbValid_ = true;
    }

    bool MeshGeometry::Raycast(const glm::vec3& localOrigin, const glm::vec3& localDirection, std::vector<LocalHit>& outHits) const {
        if (mesh_.isEmpty() || !aabbValid_) {
            return false;
        }

        float tBox = 0.0f;
        if (!RayAABBIntersect(localOrigin, localDirection, aabbMin_, aabbMax_, tBox)) {
            return false;
        }

        bool hitAnything = false;
        const size_t firstHit = outHits.size();
        const size_t vertexCount = mesh_.vertices.size() / 3;
        for (size_t i = 0; i + 2 < mesh_.indices.size(); i += 3) {
            unsigned int i0 = mesh_.indices[i], i1 = mesh_.indices[i+1], i2 = mesh_.indices[i+2];
            if (i0 >= vertexCount || i1 >= vertexCount || i2 >= vertexCount) {
                continue;
            }
            glm::vec3 v0(mesh_.vertices[i0*3], mesh_.vertices[i0*3+1], mesh_.vertices[i0*3+2]);
            glm::vec3 v1(mesh_.vertices[i1*3], mesh_.vertices[i1*3+1], mesh_.vertices[i1*3+2]);
            glm::vec3 v2(mesh_.vertices[i2*3], mesh_.vertices[i2*3+1], mesh_.vertices[i2*3+2]);

            glm::vec3 faceNormal = glm::cross(v1 - v0, v2 - v0);
            if (!doubleSided_ && glm::dot(faceNormal, localDirection) >= 0.0f) {
                continue; // Back face
            }

            float t = 0.0f;
            if (!RayTriangleIntersect(localOrigin, localDirection, v0, v1, v2, t)) {
                continue;
            }

            LocalHit hit;
            hit.point = localOrigin + localDirection * t;
            hit.normal = glm::normalize(faceNormal);
            if (glm::dot(hit.normal, localDirection) > 0.0f) {
                hit.normal = -hit.normal; // Face the ray for double-sided hits from behind
            }
            hit.triangleIndex = i;

            // A ray through the edge shared by two coplanar triangles reports one hit.
            bool duplicate = false;
            for (size_t h = firstHit; h < outHits.size(); ++h) {
                if (glm::length(outHits[h].point - hit.point) < SHARED_EDGE_EPSILON &&
                    glm::dot(outHits[h].normal, hit.normal) > COPLANAR_COS) {
                    duplicate = true;
                    break;
                }
            }
            if (duplicate) {
                continue;
            }
            outHits.push_back(hit);
            hitAnything = true;
        }
        return hitAnything;
    }

    bool MeshGeometry::getLocalBounds(glm::vec3& outMin, glm::vec3& outMax) const {
        if (!aabbValid_) {
            return false;
        }
        outMin = aabbMin_;
        outMax = aabbMax_;
        return true;
    }

    const MeshBuffers& MeshGeometry::getMesh() const {
        return mesh_;
    }

} // namespace Vireo::Engine
