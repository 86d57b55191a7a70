#include "pixelair/client/StateSynchronizer.hpp"

#include "pixelair/core/ClientError.hpp"
#include "pixelair/log/Log.hpp"

#include <algorithm>
#include <type_traits>

namespace pixelair::client {

StateSynchronizer::StateSynchronizer(std::shared_ptr<DeviceRegistry> registryValue,
                                     std::shared_ptr<ChangeNotifier> notifierValue,
                                     unsigned offlineAfterMissedPollsValue)
: registry(std::move(registryValue))
, notifier(std::move(notifierValue))
, offlineAfterMissedPolls(std::max(1u, offlineAfterMissedPollsValue))
{}

void StateSynchronizer::publishOutcome(const StateOutcome& outcome) {
    if (outcome.availabilityChanged) {
        logInfo("[StateSynchronizer] ", outcome.device.address.to_string(), " is back online\n");
        notifier->publish(ChangeKind::AvailabilityChanged, outcome.device);
    }
    if (outcome.accepted) {
        notifier->publish(ChangeKind::StateChanged, outcome.device);
    }
}

IngestResult StateSynchronizer::ingestStateReport(const Address& source,
                                                  const protocol::StateReport& report,
                                                  Clock::time_point now) {
    auto outcome = registry->applyState(source, report.stateCounter, report.state, now);
    if (!outcome.accepted) {
        logInfo("[StateSynchronizer] stale report from ", source.to_string(),
                " counter=", report.stateCounter, " (have ",
                outcome.device.stateCounter.value_or(0), ")\n");
    }
    publishOutcome(outcome);
    return {protocol::PacketType::StateReport, outcome.accepted, outcome.created};
}

IngestResult StateSynchronizer::ingestAnnouncement(const Address& source,
                                                   const protocol::Announcement& announcement,
                                                   const std::string& family,
                                                   Clock::time_point now) {
    DeviceFields fields;
    if (!family.empty()) {
        fields.family = family;
    }
    fields.mac = announcement.mac;
    fields.model = announcement.model;
    fields.nickname = announcement.nickname;
    fields.firmwareVersion = announcement.firmwareVersion;
    fields.serialNumber = announcement.serialNumber;

    auto outcome = registry->applyState(source, announcement.stateCounter, announcement.state,
                                        now, fields);
    if (outcome.created) {
        logInfo("[StateSynchronizer] discovered ", announcement.model, " '",
                announcement.nickname, "' at ", source.to_string(), "\n");
    } else if (!outcome.accepted) {
        logInfo("[StateSynchronizer] stale announcement from ", source.to_string(),
                " counter=", announcement.stateCounter, " (have ",
                outcome.device.stateCounter.value_or(0), ")\n");
    }
    publishOutcome(outcome);
    return {protocol::PacketType::Announcement, outcome.accepted, outcome.created};
}

expected<IngestResult> StateSynchronizer::ingestDatagram(const Address& source,
                                                         schema::ByteView bytes,
                                                         const std::string& family,
                                                         Clock::time_point now) {
    auto packet = protocol::decodePacket(bytes);
    if (!packet) {
        logError("[StateSynchronizer] malformed packet from ", source.to_string(),
                 " (", bytes.size(), " bytes): ", packet.error().describe(), "\n");
        return unexpected(make_error_code(ClientErrc::MalformedPacket));
    }

    return std::visit([&](const auto& p) -> IngestResult {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, protocol::Announcement>) {
            return ingestAnnouncement(source, p, family, now);
        } else if constexpr (std::is_same_v<P, protocol::StateReport>) {
            return ingestStateReport(source, p, now);
        } else if constexpr (std::is_same_v<P, protocol::DiscoveryRequest>) {
            return {protocol::PacketType::DiscoveryRequest, false, false};
        } else {
            return {protocol::PacketType::StateQuery, false, false};
        }
    }, *packet);
}

void StateSynchronizer::completePollInterval(Clock::time_point intervalStart) {
    for (const auto& device : registry->recordMissedPolls(intervalStart, offlineAfterMissedPolls)) {
        logInfo("[StateSynchronizer] ", device.address.to_string(), " offline after ",
                device.missedPolls, " silent poll intervals\n");
        notifier->publish(ChangeKind::AvailabilityChanged, device);
    }
}

} // namespace pixelair::client
