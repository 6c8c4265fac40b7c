#include "interaction/DeviceEvents.h"
#include <algorithm>

namespace Vireo::Interaction {

const char* ToString(DeviceEventType type) {
    switch (type) {
        case DeviceEventType::Select: return "select";
        case DeviceEventType::SelectStart: return "selectstart";
        case DeviceEventType::SelectEnd: return "selectend";
        case DeviceEventType::Squeeze: return "squeeze";
        case DeviceEventType::SqueezeStart: return "squeezestart";
        case DeviceEventType::SqueezeEnd: return "squeezeend";
    }
    return "unknown";
}

SubscriptionId DeviceEventBus::Subscribe(DeviceEventType type, DeviceEventHandler handler,
                                         std::optional<Handedness> handedness) {
    auto subscription = std::make_shared<Subscription>();
    subscription->id = nextId_++;
    subscription->type = type;
    subscription->handedness = handedness;
    subscription->handler = std::move(handler);
    subscriptions_.push_back(subscription);
    return subscription->id;
}

bool DeviceEventBus::Unsubscribe(SubscriptionId id) {
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
        [id](const std::shared_ptr<Subscription>& s) { return s->id == id; });
    if (it == subscriptions_.end()) {
        return false;
    }
    (*it)->active = false;
    subscriptions_.erase(it);
    return true;
}

void DeviceEventBus::Emit(DeviceEventType type, const Controller& controller) {
    DeviceEvent event;
    event.type = type;
    event.controller = controller;

    // Handlers may subscribe or unsubscribe while we iterate.
    const auto snapshot = subscriptions_;
    for (const auto& subscription : snapshot) {
        if (!subscription->active || subscription->type != type) continue;
        if (subscription->handedness && *subscription->handedness != controller.handedness) continue;
        subscription->handler(event);
    }
}

} // namespace Vireo::Interaction
