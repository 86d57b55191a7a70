#pragma once

#include "pixelair/net/NetConfig.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pixelair {

using Address = net::ip::address_v4;
using MacAddress = std::array<std::uint8_t, 6>;
using Clock = std::chrono::steady_clock;

enum class Availability : std::uint8_t {
    Online,
    Offline
};

/// Which program drives the lamp: its own automatic cycle, a stored scene, or
/// manual effect selection.
enum class DeviceMode : std::uint8_t {
    Auto = 0,
    Scene = 1,
    Manual = 2
};

/// One entry of the effect catalogue a device advertises.
struct Effect {
    std::string id;          ///< "auto", "scene:0", "manual:1", ...
    std::string displayName; ///< what a user picks from

    bool operator==(const Effect& other) const {
        return id == other.id && displayName == other.displayName;
    }
    bool operator!=(const Effect& other) const { return !(*this == other); }
};

/**
 * @brief Light output as reported by (or commanded to) a device.
 *
 * hue is in degrees (0-359), saturation in percent (0-100). `effect` holds the
 * active effect id ("auto", "scene:0", "manual:1", ...) or nothing.
 */
struct LightState {
    bool on = false;
    std::uint8_t brightness = 0;
    std::uint16_t hue = 0;
    std::uint8_t saturation = 0;
    std::optional<std::string> effect;
    DeviceMode mode = DeviceMode::Auto;
    std::vector<Effect> effects;

    bool operator==(const LightState& other) const {
        return on == other.on && brightness == other.brightness && hue == other.hue
            && saturation == other.saturation && effect == other.effect
            && mode == other.mode && effects == other.effects;
    }
    bool operator!=(const LightState& other) const { return !(*this == other); }

    /// Id of the catalogue entry called `displayName`, if there is one.
    std::optional<std::string> effectIdFor(std::string_view displayName) const;

    std::string describe() const;
};

/// Partial record for `DeviceRegistry::upsert`; unset fields are left alone.
struct DeviceFields {
    std::optional<std::string> family;
    std::optional<MacAddress> mac;
    std::optional<std::string> model;
    std::optional<std::string> nickname;
    std::optional<std::string> firmwareVersion;
    std::optional<std::string> serialNumber;
};

/**
 * @brief Snapshot of one registry record.
 *
 * Identity is the address. `lightState` may carry an optimistic value while a
 * command is awaiting confirmation; `confirmedState` is always the last state
 * the device itself reported.
 */
struct Device {
    Address address;
    std::string family;
    MacAddress mac{};
    std::string model;
    std::string nickname;
    std::string firmwareVersion;
    std::string serialNumber;

    std::optional<std::uint32_t> stateCounter;
    LightState lightState;
    LightState confirmedState;

    Availability availability = Availability::Online;
    Clock::time_point lastSeen{};

    /// Last packet of any kind, including ones rejected by the counter gate.
    Clock::time_point lastHeard{};
    /// Consecutive poll intervals without any packet from the device.
    unsigned missedPolls = 0;

    bool isOnline() const { return availability == Availability::Online; }
    std::string describe() const;
};

std::string formatMac(const MacAddress& mac);
const char* toString(Availability availability);
const char* toString(DeviceMode mode);

} // namespace pixelair
