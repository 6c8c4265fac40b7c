#include <catch2/catch.hpp>

#include "engine/scene.h"
#include "engine/scene_node.h"
#include "engine/geometry/MeshGeometry.h"
#include "engine/geometry/Primitives.h"
#include <glm/gtc/matrix_transform.hpp>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace Vireo::Engine;

namespace {
    uint64_t AddBox(Scene& scene, const glm::vec3& position, uint64_t parent = 0) {
        SceneNode* node = scene.create_mesh_object("box", Primitives::CreateBox(1.0f, 1.0f, 1.0f), parent);
        scene.SetLocalTransform(node->get_id(), glm::translate(glm::mat4(1.0f), position));
        return node->get_id();
    }

    Ray ForwardRay() {
        Ray ray;
        ray.origin = glm::vec3(0.0f);
        ray.direction = glm::vec3(0.0f, 0.0f, -1.0f);
        return ray;
    }
}

TEST_CASE("Scene hands out stable ids", "[scene]")
{
    Scene scene;
    SceneNode* a = scene.create_object("a");
    SceneNode* b = scene.create_object("b");
    REQUIRE(a);
    REQUIRE(b);
    CHECK(a->get_id() != b->get_id());
    CHECK(scene.get_object_by_id(a->get_id()) == a);
    CHECK(scene.get_object_by_id(12345) == nullptr);
    CHECK(scene.GetObjectCount() == 2);

    const uint64_t bId = b->get_id();
    scene.DeleteObject(bId);
    CHECK(scene.get_object_by_id(bId) == nullptr);
    SceneNode* c = scene.create_object("c");
    CHECK(c->get_id() != bId);

    auto all = scene.get_all_objects();
    REQUIRE(all.size() == 2);
    CHECK(all[0]->get_id() < all[1]->get_id());

    scene.NewScene();
    CHECK(scene.GetObjectCount() == 0);
}

TEST_CASE("Scene keeps the hierarchy acyclic", "[scene]")
{
    Scene scene;
    uint64_t root = scene.create_object("root")->get_id();
    uint64_t mid = scene.create_object("mid", root)->get_id();
    uint64_t leaf = scene.create_object("leaf", mid)->get_id();

    CHECK(scene.GetParentId(leaf) == mid);
    CHECK(scene.IsAncestorOf(root, leaf));
    CHECK_FALSE(scene.IsAncestorOf(leaf, root));
    CHECK(scene.get_object_by_id(root)->getChildIds() == std::vector<uint64_t>{ mid });

    CHECK_FALSE(scene.SetParent(root, leaf));
    CHECK_FALSE(scene.SetParent(mid, mid));
    CHECK_FALSE(scene.SetParent(mid, 999));
    CHECK(scene.GetParentId(root) == 0);

    REQUIRE(scene.SetParent(leaf, root));
    CHECK(scene.get_object_by_id(mid)->getChildIds().empty());
    CHECK(scene.GetParentId(leaf) == root);

    SECTION("an invalid parent at creation gives a root")
    {
        SceneNode* orphan = scene.create_object("orphan", 999);
        REQUIRE(orphan);
        CHECK(orphan->getParentId() == 0);
    }

    SECTION("deleting a node deletes its subtree")
    {
        REQUIRE(scene.SetParent(leaf, mid));
        scene.DeleteObject(mid);
        CHECK(scene.get_object_by_id(mid) == nullptr);
        CHECK(scene.get_object_by_id(leaf) == nullptr);
        CHECK(scene.get_object_by_id(root)->getChildIds().empty());
    }
}

TEST_CASE("World transforms follow the parent chain", "[scene]")
{
    Scene scene;
    uint64_t parent = scene.create_object("parent")->get_id();
    uint64_t child = scene.create_object("child", parent)->get_id();
    scene.SetLocalTransform(child, glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 1.0f, 0.0f)));
    scene.SetLocalTransform(parent, glm::translate(glm::mat4(1.0f), glm::vec3(2.0f, 0.0f, 0.0f)));

    glm::vec3 childPosition(scene.GetWorldTransform(child)[3]);
    CHECK(childPosition.x == Approx(2.0f));
    CHECK(childPosition.y == Approx(1.0f));

    // Reparenting keeps the local transform and recomputes the world one.
    REQUIRE(scene.SetParent(child, 0));
    childPosition = glm::vec3(scene.GetWorldTransform(child)[3]);
    CHECK(childPosition.x == Approx(0.0f));
    CHECK(childPosition.y == Approx(1.0f));

    CHECK_FALSE(scene.SetLocalTransform(999, glm::mat4(1.0f)));
    CHECK(scene.GetWorldTransform(999) == glm::mat4(1.0f));
}

TEST_CASE("IntersectObjects sorts hits by distance", "[scene][ray]")
{
    Scene scene;
    uint64_t far = AddBox(scene, glm::vec3(0.0f, 0.0f, -8.0f));
    uint64_t near = AddBox(scene, glm::vec3(0.0f, 0.0f, -3.0f));
    uint64_t aside = AddBox(scene, glm::vec3(4.0f, 0.0f, -3.0f));

    auto hits = scene.IntersectObjects(ForwardRay(), { far, near, aside });
    REQUIRE(hits.size() == 2);
    CHECK(hits[0].objectId == near);
    CHECK(hits[0].distance == Approx(2.5f));
    CHECK(hits[0].point.z == Approx(-2.5f));
    CHECK(hits[0].normal.z == Approx(1.0f));
    CHECK(hits[1].objectId == far);
    CHECK(hits[1].distance == Approx(7.5f));

    SECTION("near and far limits")
    {
        Ray ray = ForwardRay();
        ray.nearDistance = 3.0f;
        auto limited = scene.IntersectObjects(ray, { far, near });
        REQUIRE(limited.size() == 1);
        CHECK(limited[0].objectId == far);

        ray.nearDistance = 0.0f;
        ray.farDistance = 1.0f;
        CHECK(scene.IntersectObjects(ray, { far, near }).empty());
    }

    SECTION("only the given roots are tested")
    {
        auto only = scene.IntersectObject(ForwardRay(), far);
        REQUIRE(only.size() == 1);
        CHECK(only[0].objectId == far);
        CHECK(scene.IntersectObjects(ForwardRay(), {}).empty());
    }
}

TEST_CASE("IntersectObjects walks subtrees once", "[scene][ray]")
{
    Scene scene;
    uint64_t group = scene.create_object("group")->get_id();
    scene.SetLocalTransform(group, glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -2.0f)));
    uint64_t child = AddBox(scene, glm::vec3(0.0f, 0.0f, -3.0f), group);

    auto hits = scene.IntersectObjects(ForwardRay(), { group, child, group });
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].objectId == child);
    CHECK(hits[0].distance == Approx(4.5f));

    CHECK(scene.IntersectObjects(ForwardRay(), { group }, false).empty());
    CHECK(scene.IntersectObjects(ForwardRay(), { group }, true).size() == 1);
}

TEST_CASE("Mesh raycasts cull back faces unless double-sided", "[scene][ray]")
{
    Scene scene;
    SceneNode* box = scene.create_mesh_object("box", Primitives::CreateBox(1.0f, 1.0f, 1.0f));
    scene.SetLocalTransform(box->get_id(), glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -5.0f)));

    CHECK(scene.IntersectObject(ForwardRay(), box->get_id()).size() == 1);

    auto* mesh = dynamic_cast<MeshGeometry*>(box->getGeometry());
    REQUIRE(mesh);
    mesh->setDoubleSided(true);
    auto hits = scene.IntersectObject(ForwardRay(), box->get_id());
    REQUIRE(hits.size() == 2);
    CHECK(hits[0].distance == Approx(4.5f));
    CHECK(hits[1].distance == Approx(5.5f));
    // Normals face back along the ray.
    CHECK(hits[1].normal.z == Approx(1.0f));

    SECTION("a quad seen from behind")
    {
        SceneNode* quad = scene.create_mesh_object("quad", Primitives::CreateQuad(2.0f, 2.0f));
        scene.SetLocalTransform(quad->get_id(), glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, 3.0f)));
        Ray backwards = ForwardRay();
        backwards.direction = glm::vec3(0.0f, 0.0f, 1.0f);
        CHECK(scene.IntersectObject(backwards, quad->get_id()).empty());
    }
}

TEST_CASE("Hits on scaled nodes are reported in world space", "[scene][ray]")
{
    Scene scene;
    uint64_t box = AddBox(scene, glm::vec3(0.0f, 0.0f, -10.0f));
    glm::mat4 transform = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -10.0f));
    scene.SetLocalTransform(box, glm::scale(transform, glm::vec3(4.0f)));

    auto hits = scene.IntersectObject(ForwardRay(), box);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].distance == Approx(8.0f));
    CHECK(glm::length(hits[0].normal) == Approx(1.0f));

    SECTION("a collapsed node cannot be hit")
    {
        scene.SetLocalTransform(box, glm::scale(transform, glm::vec3(0.0f)));
        CHECK(scene.IntersectObject(ForwardRay(), box).empty());
    }
}

TEST_CASE("IntersectObjects rejects degenerate rays", "[scene][ray]")
{
    Scene scene;
    uint64_t box = AddBox(scene, glm::vec3(0.0f, 0.0f, -5.0f));

    Ray zero = ForwardRay();
    zero.direction = glm::vec3(0.0f);
    CHECK_THROWS_AS(scene.IntersectObject(zero, box), std::invalid_argument);

    Ray nan = ForwardRay();
    nan.origin.x = std::numeric_limits<float>::quiet_NaN();
    CHECK_THROWS_AS(scene.IntersectObject(nan, box), std::invalid_argument);

    CHECK_FALSE(IsValidRay(zero));
    CHECK(IsValidRay(ForwardRay()));
}

TEST_CASE("Ray primitives", "[ray]")
{
    float t = 0.0f;
    CHECK(RayTriangleIntersect(glm::vec3(0.2f, 0.2f, 1.0f), glm::vec3(0.0f, 0.0f, -1.0f),
                               glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), t));
    CHECK(t == Approx(1.0f));
    CHECK_FALSE(RayTriangleIntersect(glm::vec3(0.8f, 0.8f, 1.0f), glm::vec3(0.0f, 0.0f, -1.0f),
                                     glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), t));

    CHECK(RayAABBIntersect(glm::vec3(0.0f, 0.0f, 5.0f), glm::vec3(0.0f, 0.0f, -1.0f),
                           glm::vec3(-1.0f), glm::vec3(1.0f), t));
    CHECK(t == Approx(4.0f));
    CHECK_FALSE(RayAABBIntersect(glm::vec3(0.0f, 0.0f, 5.0f), glm::vec3(0.0f, 0.0f, 1.0f),
                                 glm::vec3(-1.0f), glm::vec3(1.0f), t));
    CHECK_FALSE(RayAABBIntersect(glm::vec3(3.0f, 0.0f, 5.0f), glm::vec3(0.0f, 0.0f, -1.0f),
                                 glm::vec3(-1.0f), glm::vec3(1.0f), t));
}

TEST_CASE("Primitive builders", "[geometry]")
{
    MeshBuffers box = Primitives::CreateBox(2.0f, 4.0f, 6.0f);
    CHECK(box.vertices.size() == 24 * 3);
    CHECK(box.triangleCount() == 12);

    MeshGeometry geometry(box);
    glm::vec3 min, max;
    REQUIRE(geometry.getLocalBounds(min, max));
    CHECK(min.x == Approx(-1.0f));
    CHECK(max.y == Approx(2.0f));
    CHECK(max.z == Approx(3.0f));

    MeshBuffers quad = Primitives::CreateQuad(2.0f, 1.0f);
    CHECK(quad.triangleCount() == 2);
    MeshGeometry quadGeometry(quad);
    REQUIRE(quadGeometry.getLocalBounds(min, max));
    CHECK(min.z == Approx(0.0f));
    CHECK(max.z == Approx(0.0f));
    CHECK(max.x == Approx(1.0f));
    CHECK(max.y == Approx(0.5f));
}
