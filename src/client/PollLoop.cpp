#include "pixelair/client/PollLoop.hpp"

#include "pixelair/log/Log.hpp"

#include <algorithm>

namespace pixelair::client {

PollLoop::PollLoop(std::shared_ptr<net::UdpSocket> socketValue,
                   std::shared_ptr<DeviceRegistry> registryValue,
                   std::shared_ptr<StateSynchronizer> synchronizerValue,
                   std::vector<DeviceFamily> familiesValue,
                   PollTiming timingValue)
: core::BackgroundWorker("PollLoop")
, socket(std::move(socketValue))
, registry(std::move(registryValue))
, synchronizer(std::move(synchronizerValue))
, families(std::move(familiesValue))
, timing(timingValue)
, buffer(config::MAX_DATAGRAM_SIZE)
{}

PollLoop::~PollLoop() {
    stop();
}

void PollLoop::run() {
    auto intervalStart = Clock::now();
    while (sleepFor(timing.interval)) {
        const auto answered = pollOnce();
        if (!running) {
            break;
        }
        synchronizer->completePollInterval(intervalStart);
        intervalStart = Clock::now();
        logInfo("[PollLoop] round complete: ", answered, "/", registry->size(), " answered\n");
    }
}

std::size_t PollLoop::pollOnce() {
    std::size_t answered = 0;
    for (const auto& device : registry->list()) {
        if (!running) {
            break;
        }
        if (queryDevice(device)) {
            ++answered;
        }
    }
    return answered;
}

bool PollLoop::queryDevice(const Device& device) {
    const DeviceFamily* family = findFamily(families, device.family);
    if (!family) {
        return false;
    }

    const auto query = protocol::encodePacket(protocol::StateQuery{});
    const net::udp::endpoint target(device.address, family->commandPort);
    if (auto ec = socket->send_to(query.data(), query.size(), target, timing.sendTimeout)) {
        logError("[PollLoop] query to ", device.address.to_string(), " failed: ", ec.message(), "\n");
        return false;
    }

    const auto deadline = Clock::now() + timing.replyTimeout;
    while (running) {
        const auto remaining =
            std::chrono::duration_cast<net::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        net::udp::endpoint from;
        std::size_t n = 0;
        auto ec = socket->recv_from(buffer.data(), buffer.size(), from, n,
                                    std::min(remaining, timing.receiveSlice));
        if (ec == net::asio::error::timed_out) {
            continue;
        }
        if (ec) {
            if (running) {
                logError("[PollLoop] receive failed: ", ec.message(), "\n");
            }
            return false;
        }
        if (!from.address().is_v4()) {
            continue;
        }

        const auto source = from.address().to_v4();
        auto result = synchronizer->ingestDatagram(source, schema::ByteView(buffer.data(), n),
                                                   std::string{}, Clock::now());
        if (result && source == device.address &&
            (result->type == protocol::PacketType::StateReport ||
             result->type == protocol::PacketType::Announcement)) {
            return true;
        }
    }
    return false;
}

} // namespace pixelair::client
