// OscMessage.hpp
// -----------------------------------------------------------------------------
// Minimal OSC 1.0 message support for PixelAir control commands.
// Only what the command port understands: one message per datagram (no
// bundles), argument types 'i' (int32), 'f' (float32) and 's' (string).

#pragma once

#include "pixelair/core/Command.hpp"
#include "pixelair/schema/pixelair_schema.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace pixelair::protocol {

// Address patterns understood by the device command port.
constexpr const char* OSC_POWER = "/pixelair/power";
constexpr const char* OSC_BRIGHTNESS = "/pixelair/brightness";
constexpr const char* OSC_COLOR = "/pixelair/color";
constexpr const char* OSC_EFFECT = "/pixelair/effect";
constexpr const char* OSC_MODE = "/pixelair/mode";

using OscArgument = std::variant<std::int32_t, float, std::string>;

struct OscMessage {
    std::string address;
    std::vector<OscArgument> arguments;

    /// Type tag string, e.g. ",iff".
    std::string typeTags() const;

    std::vector<std::uint8_t> encode() const;
    static schema::expected<OscMessage, schema::DecodeError> decode(schema::ByteView bytes);
};

/**
 * @brief Translate a control command into its OSC message.
 *
 * Brightness, hue and saturation travel as floats in 0..1, matching the
 * device's native scale; power is an int (0/1), effects a string id and the mode an int
 * (0 auto, 1 scene, 2 manual).
 */
OscMessage toOscMessage(const Command& command);

} // namespace pixelair::protocol
