#pragma once

namespace Vireo::Interaction {

// Per-frame hook run by InteractionManager::Tick after hover reconciliation.
class IFrameListener {
public:
    virtual ~IFrameListener() = default;
    virtual void OnFrameUpdate() = 0;
};

} // namespace Vireo::Interaction
