#pragma once

#include "interaction/Controller.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace Vireo::Interaction {

// Raw button events coming from the device layer.
enum class DeviceEventType {
    Select,
    SelectStart,
    SelectEnd,
    Squeeze,
    SqueezeStart,
    SqueezeEnd
};

const char* ToString(DeviceEventType type);

struct DeviceEvent {
    DeviceEventType type = DeviceEventType::Select;
    Controller controller;
};

using DeviceEventHandler = std::function<void(const DeviceEvent&)>;
using SubscriptionId = uint64_t;

// Fan-out of device events to subscribers, in subscription order.
// A subscription added during Emit is first invoked on the next Emit.
// A subscription removed during Emit is never invoked again.
class DeviceEventBus {
public:
    DeviceEventBus() = default;
    DeviceEventBus(const DeviceEventBus&) = delete;
    DeviceEventBus& operator=(const DeviceEventBus&) = delete;

    // With a handedness filter only events from controllers of that handedness are delivered.
    SubscriptionId Subscribe(DeviceEventType type, DeviceEventHandler handler,
                             std::optional<Handedness> handedness = std::nullopt);
    bool Unsubscribe(SubscriptionId id);
    void Emit(DeviceEventType type, const Controller& controller);

    size_t GetSubscriptionCount() const { return subscriptions_.size(); }

private:
    struct Subscription {
        SubscriptionId id = 0;
        DeviceEventType type = DeviceEventType::Select;
        std::optional<Handedness> handedness;
        DeviceEventHandler handler;
        bool active = true;
    };

    std::vector<std::shared_ptr<Subscription>> subscriptions_;
    SubscriptionId nextId_ = 1;
};

} // namespace Vireo::Interaction
