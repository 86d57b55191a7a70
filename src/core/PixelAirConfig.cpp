#include "pixelair/core/PixelAirConfig.hpp"

namespace pixelair {

DeviceFamily fluoraFamily() {
    return {"fluora", config::FLUORA_DISCOVERY_PORT, config::FLUORA_COMMAND_PORT};
}

DeviceFamily pixelAirFamily() {
    return {"pixelair", config::PIXELAIR_DISCOVERY_PORT, config::PIXELAIR_COMMAND_PORT};
}

const DeviceFamily* findFamily(const std::vector<DeviceFamily>& families, const std::string& name) {
    for (const auto& family : families) {
        if (family.name == name) {
            return &family;
        }
    }
    return families.empty() ? nullptr : &families.front();
}

const DeviceFamily* familyForDiscoveryPort(const std::vector<DeviceFamily>& families,
                                           std::uint16_t port) {
    for (const auto& family : families) {
        if (family.discoveryPort == port) {
            return &family;
        }
    }
    return families.empty() ? nullptr : &families.front();
}

} // namespace pixelair
