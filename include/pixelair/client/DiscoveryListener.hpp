#pragma once

#include "pixelair/client/StateSynchronizer.hpp"
#include "pixelair/core/BackgroundWorker.hpp"
#include "pixelair/core/PixelAirConfig.hpp"
#include "pixelair/net/UdpSocket.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace pixelair::client {

/// Addresses first seen during one scan window.
using DiscoveryResult = expected<std::vector<Address>>;

struct DiscoverySettings {
    std::vector<DeviceFamily> families;
    Address broadcastAddress = Address::broadcast();
    net::milliseconds window = config::DISCOVERY_WINDOW;
    net::milliseconds sendTimeout = config::SEND_TIMEOUT;
    net::milliseconds receiveSlice = config::RECEIVE_SLICE;
};

/**
 * @brief Broadcast discovery and targeted probes.
 *
 * A scan broadcasts one discovery request per family (to that family's
 * discovery port) and then ingests replies until the window closes. The
 * family of a reply is picked by its source port. Scans run on the worker
 * thread; `scan()` while a scan is in flight returns the running scan's
 * future instead of starting another.
 */
class DiscoveryListener : public core::BackgroundWorker {
public:
    DiscoveryListener(std::shared_ptr<net::asio::io_context> io,
                      std::shared_ptr<net::UdpSocket> socket,
                      std::shared_ptr<DeviceRegistry> registry,
                      std::shared_ptr<StateSynchronizer> synchronizer,
                      DiscoverySettings settings);
    ~DiscoveryListener() override;

    std::shared_future<DiscoveryResult> scan();

    /**
     * @brief Ask one address directly, e.g. after it appeared on the network.
     *
     * Sends the discovery request unicast to every family's discovery port from
     * a temporary socket and waits up to `timeout` for that address to answer.
     * Errors: `Socket` if the request could not be sent, `CommandTimeout` if no
     * announcement arrived, `NotRunning` once `shutdown()` was called.
     */
    expected<Device> probe(const Address& address, net::milliseconds timeout);

    /// Stop any scan and make in-flight and future probes return `NotRunning`.
    void shutdown(net::milliseconds deadline);

protected:
    void run() override;

private:
    DiscoveryResult runScan();
    net::error_code sendRequests(net::UdpSocket& via, const Address& target);

    std::shared_ptr<net::asio::io_context> io;
    std::shared_ptr<net::UdpSocket> socket;
    std::shared_ptr<DeviceRegistry> registry;
    std::shared_ptr<StateSynchronizer> synchronizer;
    DiscoverySettings settings;
    std::atomic<bool> closed{false};

    std::mutex scanMutex;
    std::promise<DiscoveryResult> promise;
    std::shared_future<DiscoveryResult> current;
};

} // namespace pixelair::client
