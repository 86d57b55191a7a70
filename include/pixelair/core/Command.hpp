#pragma once

#include "pixelair/core/Device.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace pixelair {

struct SetPower {
    bool on = true;
};

struct SetBrightness {
    std::uint8_t brightness = 0;
};

/// hue in degrees (0-359), saturation in percent (0-100); clamped on apply.
struct SetColor {
    std::uint16_t hue = 0;
    std::uint8_t saturation = 0;
};

struct SetEffect {
    std::string effectId;
};

struct SetMode {
    DeviceMode mode = DeviceMode::Auto;
};

using Command = std::variant<SetPower, SetBrightness, SetColor, SetEffect, SetMode>;

/// The light state a device is expected to report once it executed `command`.
LightState applyCommand(const LightState& current, const Command& command);

std::string describe(const Command& command);

} // namespace pixelair
