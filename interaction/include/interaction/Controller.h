#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Vireo::Interaction {

enum class Handedness {
    None = 0,
    Left = 1,
    Right = 2
};

const size_t HANDEDNESS_COUNT = 3;

const char* ToString(Handedness handedness);

inline size_t ToIndex(Handedness handedness) {
    return static_cast<size_t>(handedness);
}

// One tracked pointing device, as seen by the interaction system for the current frame.
struct Controller {
    uint32_t id = 0;
    Handedness handedness = Handedness::None;
    glm::mat4 worldTransform = glm::mat4(1.0f);
};

// Live list of controllers, owned by the device layer.
class IControllerSource {
public:
    virtual ~IControllerSource() = default;

    // Stable order within a frame.
    virtual const std::vector<Controller>& GetControllers() const = 0;

    // First controller with the given handedness, or nullptr.
    virtual const Controller* FindByHandedness(Handedness handedness) const;
    const Controller* FindById(uint32_t id) const;
};

// Simple IControllerSource for hosts that push poses themselves.
class ControllerRig : public IControllerSource {
public:
    ControllerRig() = default;

    uint32_t AddController(Handedness handedness, const glm::mat4& worldTransform = glm::mat4(1.0f));
    bool RemoveController(uint32_t id);
    bool SetWorldTransform(uint32_t id, const glm::mat4& worldTransform);
    const Controller* GetController(uint32_t id) const;

    const std::vector<Controller>& GetControllers() const override;

private:
    std::vector<Controller> controllers_;
    uint32_t nextId_ = 1;
};

} // namespace Vireo::Interaction
