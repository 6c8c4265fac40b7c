#include <catch2/catch.hpp>

#include "TestWorld.h"
#include "interaction/RayGrab.h"
#include <glm/gtc/matrix_transform.hpp>

using namespace Vireo::Interaction;
using Vireo::Interaction::Testing::TestWorld;

namespace {
    void RequireMatrixApprox(const glm::mat4& actual, const glm::mat4& expected) {
        for (int c = 0; c < 4; ++c) {
            for (int r = 0; r < 4; ++r) {
                CHECK(actual[c][r] == Approx(expected[c][r]).margin(1e-4));
            }
        }
    }

    glm::mat4 Pose(const glm::vec3& position, float yawDegrees) {
        glm::mat4 pose = glm::translate(glm::mat4(1.0f), position);
        return glm::rotate(pose, glm::radians(yawDegrees), glm::vec3(0.0f, 1.0f, 0.0f));
    }
}

TEST_CASE("RayGrab follows the controller while selected", "[grab]")
{
    TestWorld world;
    NodeId box = world.AddBox("box", glm::vec3(0.0f, 0.0f, -5.0f));
    RayGrab grab(world.manager, box);
    CHECK_FALSE(grab.IsGrabbing());
    CHECK(grab.GetGrabbingControllerId() == 0);

    world.Emit(DeviceEventType::SelectStart, world.right);
    REQUIRE(grab.IsGrabbing());
    CHECK(grab.GetGrabbingControllerId() == world.right);

    // No controller motion yet: nothing moves.
    world.manager.Tick();
    RequireMatrixApprox(world.scene.GetWorldTransform(box), glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -5.0f)));

    SECTION("translation")
    {
        world.Aim(world.right, glm::vec3(1.0f, 0.5f, 0.0f));
        world.manager.Tick();
        RequireMatrixApprox(world.scene.GetWorldTransform(box), glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 0.5f, -5.0f)));

        world.Aim(world.right, glm::vec3(2.0f, 0.5f, 0.0f));
        world.manager.Tick();
        RequireMatrixApprox(world.scene.GetWorldTransform(box), glm::translate(glm::mat4(1.0f), glm::vec3(2.0f, 0.5f, -5.0f)));
    }

    SECTION("rotation swings the node around the controller")
    {
        world.rig.SetWorldTransform(world.right, Pose(glm::vec3(0.0f), 90.0f));
        world.manager.Tick();
        glm::vec3 position(world.scene.GetWorldTransform(box)[3]);
        CHECK(position.x == Approx(-5.0f));
        CHECK(position.y == Approx(0.0f).margin(1e-5));
        CHECK(position.z == Approx(0.0f).margin(1e-5));
    }

    SECTION("select-end from the grabbing controller releases")
    {
        world.Emit(DeviceEventType::SelectEnd, world.right);
        CHECK_FALSE(grab.IsGrabbing());

        world.Aim(world.right, glm::vec3(3.0f, 0.0f, 0.0f));
        world.manager.Tick();
        RequireMatrixApprox(world.scene.GetWorldTransform(box), glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -5.0f)));
    }
}

TEST_CASE("RayGrab returns the node to its start after a closed controller loop", "[grab]")
{
    TestWorld world;
    NodeId box = world.AddBox("box", glm::vec3(0.0f, 0.0f, -5.0f));
    glm::mat4 start = glm::rotate(glm::translate(glm::mat4(1.0f), glm::vec3(0.3f, -0.2f, -5.0f)),
                                  glm::radians(30.0f), glm::vec3(1.0f, 0.0f, 0.0f));
    world.scene.SetLocalTransform(box, start);
    RayGrab grab(world.manager, box);

    const glm::mat4 c0 = Pose(glm::vec3(0.0f), 0.0f);
    world.rig.SetWorldTransform(world.right, c0);
    world.Emit(DeviceEventType::SelectStart, world.right);
    REQUIRE(grab.IsGrabbing());

    world.rig.SetWorldTransform(world.right, Pose(glm::vec3(0.4f, 1.0f, -0.5f), 35.0f));
    world.manager.Tick();
    world.rig.SetWorldTransform(world.right, Pose(glm::vec3(-1.0f, 0.2f, 0.3f), -20.0f));
    world.manager.Tick();
    world.rig.SetWorldTransform(world.right, c0);
    world.manager.Tick();

    RequireMatrixApprox(world.scene.get_object_by_id(box)->getTransform(), start);
}

TEST_CASE("RayGrab moves descendants with the grabbed node", "[grab]")
{
    TestWorld world;
    NodeId table = world.AddBox("table", glm::vec3(0.0f, 0.0f, -5.0f));
    NodeId cup = world.AddBox("cup", glm::vec3(0.0f, 1.0f, 0.0f), table, 0.2f);
    RayGrab grab(world.manager, table);

    world.Emit(DeviceEventType::SelectStart, world.right);
    world.Aim(world.right, glm::vec3(0.0f, 0.0f, 1.0f));
    world.manager.Tick();

    glm::vec3 cupPosition(world.scene.GetWorldTransform(cup)[3]);
    CHECK(cupPosition.x == Approx(0.0f).margin(1e-5));
    CHECK(cupPosition.y == Approx(1.0f));
    CHECK(cupPosition.z == Approx(-4.0f));
    RequireMatrixApprox(world.scene.get_object_by_id(cup)->getTransform(), glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 1.0f, 0.0f)));
}

TEST_CASE("RayGrab ignores other controllers' select-end", "[grab]")
{
    TestWorld world;
    uint32_t left = world.rig.AddController(Handedness::Left, glm::translate(glm::mat4(1.0f), glm::vec3(20.0f, 0.0f, 0.0f)));
    NodeId box = world.AddBox("box", glm::vec3(0.0f, 0.0f, -5.0f));
    RayGrab grab(world.manager, box);

    world.Emit(DeviceEventType::SelectStart, world.right);
    REQUIRE(grab.IsGrabbing());

    world.Emit(DeviceEventType::SelectEnd, left);
    CHECK(grab.IsGrabbing());
    CHECK(grab.GetGrabbingControllerId() == world.right);

    // A select-start that misses the node does not take it over.
    world.Emit(DeviceEventType::SelectStart, left);
    CHECK(grab.GetGrabbingControllerId() == world.right);

    world.Emit(DeviceEventType::SelectEnd, world.right);
    CHECK_FALSE(grab.IsGrabbing());
}

TEST_CASE("RayGrab only starts on its own node", "[grab]")
{
    TestWorld world;
    NodeId grabbed = world.AddBox("grabbed", glm::vec3(5.0f, 0.0f, -5.0f));
    NodeId other = world.AddBox("other", glm::vec3(0.0f, 0.0f, -5.0f));
    world.manager.AddInteraction(other, InteractionType::SelectStart, [](InteractionEvent&) {});
    RayGrab grab(world.manager, grabbed);

    world.Emit(DeviceEventType::SelectStart, world.right);
    CHECK_FALSE(grab.IsGrabbing());
}

TEST_CASE("RayGrab releases when the controller goes away", "[grab]")
{
    TestWorld world;
    NodeId box = world.AddBox("box", glm::vec3(0.0f, 0.0f, -5.0f));
    RayGrab grab(world.manager, box);

    world.Emit(DeviceEventType::SelectStart, world.right);
    REQUIRE(grab.IsGrabbing());

    REQUIRE(world.rig.RemoveController(world.right));
    world.manager.Tick();
    CHECK_FALSE(grab.IsGrabbing());
    RequireMatrixApprox(world.scene.GetWorldTransform(box), glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -5.0f)));
}

TEST_CASE("Destroying a RayGrab removes every hook it installed", "[grab]")
{
    TestWorld world;
    NodeId box = world.AddBox("box", glm::vec3(0.0f, 0.0f, -5.0f));
    const size_t baseSubscriptions = world.bus.GetSubscriptionCount();
    {
        RayGrab grab(world.manager, box);
        CHECK(world.manager.GetRegistry().Has(box, InteractionType::SelectStart));
        CHECK(world.bus.GetSubscriptionCount() == baseSubscriptions + 1);
        world.Emit(DeviceEventType::SelectStart, world.right);
    }
    CHECK_FALSE(world.manager.GetRegistry().Has(box));
    CHECK(world.bus.GetSubscriptionCount() == baseSubscriptions);

    // Frames and events after destruction must not touch the node.
    world.Aim(world.right, glm::vec3(1.0f, 0.0f, 0.0f));
    world.manager.Tick();
    world.Emit(DeviceEventType::SelectEnd, world.right);
    RequireMatrixApprox(world.scene.GetWorldTransform(box), glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 0.0f, -5.0f)));
}
