#include "pixelair/client/DiscoveryListener.hpp"

#include "pixelair/core/ClientError.hpp"
#include "pixelair/log/Log.hpp"

#include <algorithm>
#include <chrono>

namespace pixelair::client {

namespace {

std::string familyOfReply(const std::vector<DeviceFamily>& families, std::uint16_t sourcePort) {
    const DeviceFamily* family = familyForDiscoveryPort(families, sourcePort);
    return family ? family->name : std::string{};
}

} // namespace

DiscoveryListener::DiscoveryListener(std::shared_ptr<net::asio::io_context> ioValue,
                                     std::shared_ptr<net::UdpSocket> socketValue,
                                     std::shared_ptr<DeviceRegistry> registryValue,
                                     std::shared_ptr<StateSynchronizer> synchronizerValue,
                                     DiscoverySettings settingsValue)
: core::BackgroundWorker("DiscoveryListener")
, io(std::move(ioValue))
, socket(std::move(socketValue))
, registry(std::move(registryValue))
, synchronizer(std::move(synchronizerValue))
, settings(std::move(settingsValue))
{}

DiscoveryListener::~DiscoveryListener() {
    closed = true;
    stop();
}

std::shared_future<DiscoveryResult> DiscoveryListener::scan() {
    std::lock_guard lock(scanMutex);
    if (closed) {
        std::promise<DiscoveryResult> refused;
        refused.set_value(unexpected(make_error_code(ClientErrc::NotRunning)));
        return refused.get_future().share();
    }
    if (isRunning() && current.valid()) {
        if (current.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            logInfo("[DiscoveryListener] scan already in progress, joining it\n");
            return current;
        }
        // The previous scan has delivered its result; its thread is on the way out.
        stop();
    }
    promise = std::promise<DiscoveryResult>();
    current = promise.get_future().share();
    if (!start()) {
        promise.set_value(unexpected(make_error_code(ClientErrc::NotRunning)));
    }
    return current;
}

void DiscoveryListener::shutdown(net::milliseconds deadline) {
    closed = true;
    stop(deadline);
}

void DiscoveryListener::run() {
    auto result = runScan();
    std::lock_guard lock(scanMutex);
    promise.set_value(std::move(result));
}

net::error_code DiscoveryListener::sendRequests(net::UdpSocket& via, const Address& target) {
    const auto request = protocol::encodePacket(protocol::DiscoveryRequest{});
    net::error_code lastError;
    std::size_t sent = 0;
    for (const auto& family : settings.families) {
        const net::udp::endpoint destination(target, family.discoveryPort);
        if (auto ec = via.send_to(request.data(), request.size(), destination, settings.sendTimeout)) {
            logError("[DiscoveryListener] request to ", destination.address().to_string(), ":",
                     destination.port(), " (", family.name, ") failed: ", ec.message(), "\n");
            lastError = ec;
            continue;
        }
        ++sent;
    }
    return sent > 0 ? net::error_code{} : lastError;
}

DiscoveryResult DiscoveryListener::runScan() {
    if (!running) {
        return std::vector<Address>{};
    }

    if (auto ec = sendRequests(*socket, settings.broadcastAddress)) {
        return unexpected(make_error_code(ClientErrc::Socket));
    }
    logInfo("[DiscoveryListener] scanning for ", settings.window.count(), "ms\n");

    std::vector<Address> found;
    std::vector<std::uint8_t> buffer(config::MAX_DATAGRAM_SIZE);
    const auto deadline = Clock::now() + settings.window;

    while (running) {
        const auto remaining =
            std::chrono::duration_cast<net::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        net::udp::endpoint from;
        std::size_t n = 0;
        auto ec = socket->recv_from(buffer.data(), buffer.size(), from, n,
                                    std::min(remaining, settings.receiveSlice));
        if (ec == net::asio::error::timed_out) {
            continue;
        }
        if (ec) {
            if (running) {
                logError("[DiscoveryListener] receive failed: ", ec.message(), "\n");
                sleepFor(settings.receiveSlice);
            }
            continue;
        }
        if (!from.address().is_v4()) {
            continue;
        }

        const auto source = from.address().to_v4();
        auto result = synchronizer->ingestDatagram(source, schema::ByteView(buffer.data(), n),
                                                   familyOfReply(settings.families, from.port()),
                                                   Clock::now());
        if (result && result->created &&
            std::find(found.begin(), found.end(), source) == found.end()) {
            found.push_back(source);
        }
    }

    logInfo("[DiscoveryListener] scan finished, ", found.size(), " new device(s)\n");
    return found;
}

expected<Device> DiscoveryListener::probe(const Address& address, net::milliseconds timeout) {
    if (closed) {
        return unexpected(make_error_code(ClientErrc::NotRunning));
    }

    net::UdpSocket probeSocket(io);
    if (auto ec = probeSocket.open_and_bind(0, false)) {
        logError("[DiscoveryListener] probe socket failed: ", ec.message(), "\n");
        return unexpected(make_error_code(ClientErrc::Socket));
    }
    if (auto ec = sendRequests(probeSocket, address)) {
        return unexpected(make_error_code(ClientErrc::Socket));
    }

    std::vector<std::uint8_t> buffer(config::MAX_DATAGRAM_SIZE);
    const auto deadline = Clock::now() + timeout;
    while (!closed) {
        const auto remaining =
            std::chrono::duration_cast<net::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            logInfo("[DiscoveryListener] probe of ", address.to_string(), " timed out\n");
            return unexpected(make_error_code(ClientErrc::CommandTimeout));
        }

        net::udp::endpoint from;
        std::size_t n = 0;
        auto ec = probeSocket.recv_from(buffer.data(), buffer.size(), from, n,
                                        std::min(remaining, settings.receiveSlice));
        if (ec == net::asio::error::timed_out) {
            continue;
        }
        if (ec) {
            logError("[DiscoveryListener] probe receive failed: ", ec.message(), "\n");
            return unexpected(make_error_code(ClientErrc::Socket));
        }
        if (!from.address().is_v4() || from.address().to_v4() != address) {
            continue;
        }

        auto result = synchronizer->ingestDatagram(address, schema::ByteView(buffer.data(), n),
                                                   familyOfReply(settings.families, from.port()),
                                                   Clock::now());
        if (result && result->type == protocol::PacketType::Announcement) {
            if (auto device = registry->get(address)) {
                return *device;
            }
        }
    }
    return unexpected(make_error_code(ClientErrc::NotRunning));
}

} // namespace pixelair::client
