#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pixelair::config {

/**
 * @brief Default constants for PixelAir discovery, state tracking and control.
 *
 * `ClientConfig` copies these at construction; tests and tools override the
 * runtime fields rather than these values.
 */

// Networking ------------------------------------------------------------------
constexpr std::uint16_t FLUORA_DISCOVERY_PORT = 48899;
constexpr std::uint16_t FLUORA_COMMAND_PORT = 48900;
constexpr std::uint16_t PIXELAIR_DISCOVERY_PORT = 9090;
constexpr std::uint16_t PIXELAIR_COMMAND_PORT = 6767;
constexpr std::uint16_t CLIENT_LISTEN_PORT = 12345;
constexpr const char* BROADCAST_ADDRESS = "255.255.255.255";
constexpr std::size_t MAX_DATAGRAM_SIZE = 1500;

// Timing ----------------------------------------------------------------------
constexpr std::chrono::milliseconds DISCOVERY_WINDOW{10000};
constexpr std::chrono::milliseconds PROBE_TIMEOUT{5000};
constexpr std::chrono::milliseconds POLL_INTERVAL{30000};
constexpr std::chrono::milliseconds POLL_REPLY_TIMEOUT{2000};
constexpr std::chrono::milliseconds COMMAND_CONFIRM_TIMEOUT{1500};
constexpr std::chrono::milliseconds SEND_TIMEOUT{500};
constexpr std::chrono::milliseconds SEND_BACKOFF{100};
constexpr std::chrono::milliseconds RECEIVE_SLICE{100};
constexpr std::chrono::milliseconds TEARDOWN_DEADLINE{2000};

// State tracking --------------------------------------------------------------
constexpr unsigned OFFLINE_AFTER_MISSED_POLLS = 3;
constexpr unsigned COMMAND_MAX_RETRIES = 2;

} // namespace pixelair::config

namespace pixelair {

/**
 * @brief Port scheme of one device family.
 *
 * Sources disagree on the ports across families, so each family carries its
 * own pair and the two schemes are never assumed to interoperate.
 */
struct DeviceFamily {
    std::string name;
    std::uint16_t discoveryPort = 0; ///< device-side port receiving discovery requests
    std::uint16_t commandPort = 0;   ///< device-side port receiving OSC commands and state queries
};

DeviceFamily fluoraFamily();
DeviceFamily pixelAirFamily();

/// Find a family by name; falls back to the first configured family.
const DeviceFamily* findFamily(const std::vector<DeviceFamily>& families, const std::string& name);

/// Family whose discovery port matches the source port of a reply.
const DeviceFamily* familyForDiscoveryPort(const std::vector<DeviceFamily>& families,
                                           std::uint16_t port);

struct ClientConfig {
    std::vector<DeviceFamily> families{pixelAirFamily(), fluoraFamily()};
    std::string broadcastAddress = config::BROADCAST_ADDRESS;

    /// Local port for pushed state reports; 0 picks an ephemeral port.
    std::uint16_t listenPort = config::CLIENT_LISTEN_PORT;

    std::chrono::milliseconds discoveryWindow = config::DISCOVERY_WINDOW;
    std::chrono::milliseconds probeTimeout = config::PROBE_TIMEOUT;
    std::chrono::milliseconds pollInterval = config::POLL_INTERVAL;
    std::chrono::milliseconds pollReplyTimeout = config::POLL_REPLY_TIMEOUT;
    unsigned offlineAfterMissedPolls = config::OFFLINE_AFTER_MISSED_POLLS;

    bool confirmCommands = true;
    std::chrono::milliseconds commandConfirmTimeout = config::COMMAND_CONFIRM_TIMEOUT;
    unsigned commandMaxRetries = config::COMMAND_MAX_RETRIES;
    std::chrono::milliseconds sendTimeout = config::SEND_TIMEOUT;
    std::chrono::milliseconds sendBackoff = config::SEND_BACKOFF;

    std::chrono::milliseconds receiveSlice = config::RECEIVE_SLICE;
    std::chrono::milliseconds teardownDeadline = config::TEARDOWN_DEADLINE;
};

} // namespace pixelair
