// Headless host for the interaction engine: builds a small scene, attaches
// interactions and drives two scripted controllers through it.

#include <engine/scene.h>
#include <engine/scene_node.h>
#include <engine/geometry/Primitives.h>
#include <interaction/Controller.h>
#include <interaction/DeviceEvents.h>
#include <interaction/InteractionManager.h>
#include <interaction/Interactive.h>
#include <interaction/RayGrab.h>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace Vireo;
using Interaction::Handedness;
using Interaction::NodeId;

namespace {

    const int DEFAULT_FRAMES = 120;

    uint64_t AddBox(Engine::Scene& scene, const std::string& name, const glm::vec3& position, float size, uint64_t parent) {
        Engine::SceneNode* node = scene.create_mesh_object(name, Engine::Primitives::CreateBox(size, size, size), parent);
        scene.SetLocalTransform(node->get_id(), glm::translate(glm::mat4(1.0f), position));
        return node->get_id();
    }

    std::string NameOf(const Engine::Scene& scene, NodeId id) {
        const Engine::SceneNode* node = scene.get_object_by_id(id);
        return node ? node->get_name() : std::string("<deleted>");
    }

    // Logs every interaction a node receives.
    Interaction::Interactive MakeLoggingInteractive(Interaction::InteractionManager& manager, NodeId node) {
        Engine::Scene& scene = manager.GetScene();
        auto describe = [&scene](const char* what, const Interaction::InteractionBaseEvent& e) {
            std::cout << "Shell: " << what << " " << NameOf(scene, e.eventObject)
                      << " (" << Interaction::ToString(e.controller.handedness) << ")" << std::endl;
        };

        Interaction::InteractiveHandlers handlers;
        handlers.onHover = [describe](Interaction::InteractionWithIntersectionEvent& e) { describe("hover", e); };
        handlers.onBlur = [describe](const Interaction::InteractionNoIntersectionEvent& e) { describe("blur", e); };
        handlers.onSelect = [describe](Interaction::InteractionWithIntersectionEvent& e) {
            describe("select", e);
            std::cout << "Shell:   hit at distance " << e.intersection.distance << std::endl;
        };
        handlers.onSqueeze = [describe](Interaction::InteractionWithIntersectionEvent& e) { describe("squeeze", e); };
        handlers.onSelectMissed = [describe](const Interaction::InteractionNoIntersectionEvent& e) { describe("select missed", e); };
        return Interaction::Interactive(&manager, node, handlers);
    }

    glm::mat4 ControllerPose(const glm::vec3& position, float yawDegrees) {
        glm::mat4 pose = glm::translate(glm::mat4(1.0f), position);
        return glm::rotate(pose, glm::radians(yawDegrees), glm::vec3(0.0f, 1.0f, 0.0f));
    }

    int ParseFrameCount(int argc, char* argv[]) {
        if (argc < 2) {
            return DEFAULT_FRAMES;
        }
        int frames = std::stoi(argv[1]);
        if (frames < 4) {
            std::cerr << "Shell: Warning - at least 4 frames are needed, using 4." << std::endl;
            frames = 4;
        }
        return frames;
    }

}

int main(int argc, char* argv[]) {
    std::cout << "Shell: Starting Vireo interaction demo..." << std::endl;

    int frames = DEFAULT_FRAMES;
    try {
        frames = ParseFrameCount(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Shell: Invalid frame count '" << argv[1] << "': " << e.what() << std::endl;
        std::cerr << "Usage: vireo_shell [frames]" << std::endl;
        return EXIT_FAILURE;
    }

    Engine::Scene scene;
    Interaction::ControllerRig rig;
    Interaction::DeviceEventBus bus;
    Interaction::InteractionManager manager(scene, rig, bus);

    // --- Scene ---
    uint64_t table = scene.create_object("table")->get_id();
    scene.SetLocalTransform(table, glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 1.0f, -3.0f)));
    uint64_t redBox = AddBox(scene, "red_box", glm::vec3(-0.6f, 0.0f, 0.0f), 0.4f, table);
    uint64_t blueBox = AddBox(scene, "blue_box", glm::vec3(0.6f, 0.0f, 0.0f), 0.4f, table);
    Engine::SceneNode* panel = scene.create_mesh_object("panel", Engine::Primitives::CreateQuad(1.0f, 0.6f));
    scene.SetLocalTransform(panel->get_id(), glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 2.0f, -2.5f)));
    std::cout << "Shell: Scene ready with " << scene.GetObjectCount() << " objects." << std::endl;

    // --- Interactions ---
    std::vector<Interaction::Interactive> interactives;
    interactives.push_back(MakeLoggingInteractive(manager, table));
    interactives.push_back(MakeLoggingInteractive(manager, redBox));
    interactives.push_back(MakeLoggingInteractive(manager, panel->get_id()));

    Interaction::InteractiveHandlers panelStop;
    panelStop.onHover = [](Interaction::InteractionWithIntersectionEvent& e) { e.StopPropagation(); };
    interactives.emplace_back(&manager, panel->get_id(), panelStop);

    auto grab = std::make_unique<Interaction::RayGrab>(manager, blueBox);

    manager.SetGlobalOnSelectMissed([](const Interaction::GlobalSelectMissedEvent& e) {
        std::cout << "Shell: " << Interaction::ToString(e.controller.handedness) << " select hit nothing." << std::endl;
    });

    // --- Controllers ---
    uint32_t right = rig.AddController(Handedness::Right, ControllerPose(glm::vec3(0.0f, 1.0f, 0.0f), 30.0f));
    uint32_t left = rig.AddController(Handedness::Left, ControllerPose(glm::vec3(0.0f, 2.0f, 0.0f), 0.0f));

    const int selectFrame = frames / 4;
    const int squeezeFrame = frames / 3;
    const int grabStartFrame = frames / 2;
    const int leftMissFrame = (2 * frames) / 3;
    const int grabEndFrame = (3 * frames) / 4;

    std::cout << "Shell: >>> Running " << frames << " frames..." << std::endl;
    try {
        for (int frame = 0; frame < frames; ++frame) {
            // Right sweeps from the red box (left of the ray) to the blue one and back a little.
            float t = static_cast<float>(frame) / static_cast<float>(frames - 1);
            float yaw = 30.0f - 60.0f * t;
            if (frame > grabStartFrame) {
                yaw = -11.3f + 10.0f * (t - 0.5f);
            }
            rig.SetWorldTransform(right, ControllerPose(glm::vec3(0.0f, 1.0f, 0.0f), yaw));

            // Left points at the panel, then turns away.
            if (frame >= leftMissFrame) {
                rig.SetWorldTransform(left, ControllerPose(glm::vec3(0.0f, 2.0f, 0.0f), 90.0f));
            }

            if (frame == selectFrame) bus.Emit(Interaction::DeviceEventType::Select, *rig.GetController(right));
            if (frame == squeezeFrame) bus.Emit(Interaction::DeviceEventType::Squeeze, *rig.GetController(left));
            if (frame == grabStartFrame) {
                // Aim straight at the blue box before pressing.
                rig.SetWorldTransform(right, ControllerPose(glm::vec3(0.0f, 1.0f, 0.0f), -11.3f));
                bus.Emit(Interaction::DeviceEventType::SelectStart, *rig.GetController(right));
            }
            if (frame == leftMissFrame) bus.Emit(Interaction::DeviceEventType::Select, *rig.GetController(left));
            if (frame == grabEndFrame) bus.Emit(Interaction::DeviceEventType::SelectEnd, *rig.GetController(right));

            manager.Tick();
        }
    } catch (const std::exception& e) {
        std::cerr << "Shell: Frame loop aborted: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    glm::vec3 bluePosition(scene.GetWorldTransform(blueBox)[3]);
    std::cout << "Shell: blue_box ended at (" << bluePosition.x << ", " << bluePosition.y << ", " << bluePosition.z << ")" << std::endl;

    grab.reset();
    interactives.clear();
    std::cout << "Shell: Done. " << manager.GetRegistry().Size() << " interaction targets left." << std::endl;
    return EXIT_SUCCESS;
}
