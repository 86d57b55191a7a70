#pragma once

#include "pixelair/core/ChangeNotifier.hpp"
#include "pixelair/core/DeviceRegistry.hpp"
#include "pixelair/core/Expected.hpp"
#include "pixelair/protocol/Packets.hpp"

#include <memory>
#include <string>

namespace pixelair::client {

/// What one datagram did to the registry.
struct IngestResult {
    protocol::PacketType type = protocol::PacketType::StateReport;
    bool accepted = false; ///< state applied through the counter gate
    bool created = false;  ///< first packet ever seen from this address
};

/**
 * @brief Funnels every state-carrying packet through one counter-gated update.
 *
 * Discovery replies, pushed state reports and poll replies all end up in
 * `ingestAnnouncement` / `ingestStateReport`, which call
 * `DeviceRegistry::applyState` and turn its outcome into notifications:
 * at most one `StateChanged` per accepted packet, and a separate
 * `AvailabilityChanged` when a device comes back Online. Nothing here touches
 * a socket, so the merge rule can be driven directly.
 */
class StateSynchronizer {
public:
    StateSynchronizer(std::shared_ptr<DeviceRegistry> registry,
                      std::shared_ptr<ChangeNotifier> notifier,
                      unsigned offlineAfterMissedPolls);

    IngestResult ingestStateReport(const Address& source, const protocol::StateReport& report,
                                   Clock::time_point now);

    /// Identity fields, and `family` when non-empty, are applied together with
    /// the state and only when the counter gate accepts the announcement.
    IngestResult ingestAnnouncement(const Address& source, const protocol::Announcement& announcement,
                                    const std::string& family, Clock::time_point now);

    /**
     * @brief Decode one datagram and route it.
     *
     * Malformed datagrams are logged and reported as `ClientErrc::MalformedPacket`;
     * requests (discovery / state query) are ignored with `accepted == false`.
     */
    expected<IngestResult> ingestDatagram(const Address& source, schema::ByteView bytes,
                                          const std::string& family, Clock::time_point now);

    /**
     * @brief Close one poll interval that began at `intervalStart`.
     *
     * Devices silent for the whole interval accumulate a missed poll; those
     * reaching the threshold go Offline with an `AvailabilityChanged` event.
     */
    void completePollInterval(Clock::time_point intervalStart);

private:
    void publishOutcome(const StateOutcome& outcome);

    std::shared_ptr<DeviceRegistry> registry;
    std::shared_ptr<ChangeNotifier> notifier;
    unsigned offlineAfterMissedPolls;
};

} // namespace pixelair::client
