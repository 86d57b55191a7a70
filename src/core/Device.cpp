#include "pixelair/core/Device.hpp"

#include <iomanip>
#include <sstream>

namespace pixelair {

std::string LightState::describe() const {
    std::ostringstream os;
    os << (on ? "on" : "off")
       << " brightness=" << static_cast<int>(brightness)
       << " hue=" << hue
       << " saturation=" << static_cast<int>(saturation)
       << " effect=" << (effect ? *effect : "-")
       << " mode=" << toString(mode);
    if (!effects.empty()) {
        os << " effects=" << effects.size();
    }
    return os.str();
}

std::optional<std::string> LightState::effectIdFor(std::string_view displayName) const {
    for (const auto& entry : effects) {
        if (entry.displayName == displayName) {
            return entry.id;
        }
    }
    return std::nullopt;
}

std::string Device::describe() const {
    std::ostringstream os;
    os << address.to_string()
       << " [" << (nickname.empty() ? "unnamed" : nickname) << "]"
       << " model=" << (model.empty() ? "?" : model)
       << " mac=" << formatMac(mac)
       << " family=" << family
       << " " << toString(availability);
    if (stateCounter) {
        os << " counter=" << *stateCounter << " " << lightState.describe();
    }
    return os.str();
}

std::string formatMac(const MacAddress& mac) {
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < mac.size(); ++i) {
        if (i) os << ':';
        os << std::setw(2) << static_cast<int>(mac[i]);
    }
    return os.str();
}

const char* toString(Availability availability) {
    switch (availability) {
        case Availability::Online:  return "online";
        case Availability::Offline: return "offline";
    }
    return "unknown";
}

const char* toString(DeviceMode mode) {
    switch (mode) {
        case DeviceMode::Auto:   return "auto";
        case DeviceMode::Scene:  return "scene";
        case DeviceMode::Manual: return "manual";
    }
    return "unknown";
}

} // namespace pixelair
