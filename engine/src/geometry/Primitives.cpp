#include "engine/geometry/Primitives.h"
#include <glm/glm.hpp>

namespace {

    struct FaceBasis {
        glm::vec3 normal;
        glm::vec3 u; // u x v == normal
        glm::vec3 v;
    };

    void AppendFace(Vireo::Engine::MeshBuffers& mesh, const FaceBasis& face, const glm::vec3& halfExtents) {
        const unsigned int base = static_cast<unsigned int>(mesh.vertices.size() / 3);
        const float corners[4][2] = { {-1.0f, -1.0f}, {1.0f, -1.0f}, {1.0f, 1.0f}, {-1.0f, 1.0f} };
        for (const auto& c : corners) {
            glm::vec3 p = (face.normal + face.u * c[0] + face.v * c[1]) * halfExtents;
            mesh.vertices.insert(mesh.vertices.end(), { p.x, p.y, p.z });
            mesh.normals.insert(mesh.normals.end(), { face.normal.x, face.normal.y, face.normal.z });
        }
        mesh.indices.insert(mesh.indices.end(), { base, base + 1, base + 2, base, base + 2, base + 3 });
    }

}

namespace Vireo::Engine::Primitives {

    MeshBuffers CreateBox(float dx, float dy, float dz) {
        const glm::vec3 X(1.0f, 0.0f, 0.0f), Y(0.0f, 1.0f, 0.0f), Z(0.0f, 0.0f, 1.0f);
        const FaceBasis faces[6] = {
            {  X, Y, Z }, { -X, Z, Y },
            {  Y, Z, X }, { -Y, X, Z },
            {  Z, X, Y }, { -Z, Y, X },
        };
        const glm::vec3 halfExtents(dx * 0.5f, dy * 0.5f, dz * 0.5f);

        MeshBuffers mesh;
        mesh.vertices.reserve(6 * 4 * 3);
        mesh.normals.reserve(6 * 4 * 3);
        mesh.indices.reserve(6 * 6);
        for (const auto& face : faces) {
            AppendFace(mesh, face, halfExtents);
        }
        return mesh;
    }

    MeshBuffers CreateQuad(float width, float height) {
        MeshBuffers mesh;
        // The normal component is zeroed by the z half extent so the quad lies in z == 0.
        AppendFace(mesh, { glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f) },
                   glm::vec3(width * 0.5f, height * 0.5f, 0.0f));
        return mesh;
    }

} // namespace Vireo::Engine::Primitives
