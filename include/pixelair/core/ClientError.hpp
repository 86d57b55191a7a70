#pragma once

#include <string>
#include <system_error>

namespace pixelair {

/**
 * @brief Failure taxonomy of the device-communication core.
 *
 * - MalformedPacket: a datagram failed to decode. Logged and dropped by the
 *   background loops, never surfaced to a consumer.
 * - UnknownDevice: a command or probe named an address missing from the registry.
 * - CommandTimeout: no confirming state update arrived after all retries
 *   (also used for an unanswered probe).
 * - Socket: bind/send failure. Fatal for an acquire() attempt, per-command
 *   otherwise.
 * - NotRunning: the operation needs an acquired client.
 */
enum class ClientErrc {
    MalformedPacket = 1,
    UnknownDevice,
    CommandTimeout,
    Socket,
    NotRunning
};

const std::error_category& clientCategory() noexcept;

std::error_code make_error_code(ClientErrc errc) noexcept;

} // namespace pixelair

namespace std {
template <>
struct is_error_code_enum<pixelair::ClientErrc> : true_type {};
} // namespace std
