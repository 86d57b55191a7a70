#include "pixelair/client/Client.hpp"

#include "pixelair/client/CommandSender.hpp"
#include "pixelair/client/CommandTransport.hpp"
#include "pixelair/client/PollLoop.hpp"
#include "pixelair/client/PushReceiver.hpp"
#include "pixelair/client/StateSynchronizer.hpp"
#include "pixelair/core/ClientError.hpp"
#include "pixelair/log/Log.hpp"
#include "pixelair/net/NetService.hpp"
#include "pixelair/net/UdpSocket.hpp"

#include <algorithm>

namespace pixelair {

const char* toString(LifecycleState state) {
    switch (state) {
        case LifecycleState::Stopped: return "stopped";
        case LifecycleState::Starting: return "starting";
        case LifecycleState::Running: return "running";
        case LifecycleState::Stopping: return "stopping";
    }
    return "unknown";
}

// Everything that exists only while the client is acquired. Members are
// destroyed bottom-up, so the NetService outlives every socket and worker.
struct Client::Runtime {
    std::unique_ptr<net::NetService> net;

    std::shared_ptr<net::UdpSocket> pushSocket;
    std::shared_ptr<net::UdpSocket> pollSocket;
    std::shared_ptr<net::UdpSocket> discoverySocket;
    std::shared_ptr<client::UdpCommandTransport> transport;

    std::shared_ptr<client::CommandSender> sender;
    std::unique_ptr<client::PushReceiver> push;
    std::unique_ptr<client::PollLoop> poll;
    std::shared_ptr<client::DiscoveryListener> discovery;

    void closeSockets() {
        if (transport) transport->close();
        if (discoverySocket) discoverySocket->close();
        if (pollSocket) pollSocket->close();
        if (pushSocket) pushSocket->close();
    }
};

Client::Client(ClientConfig config)
: config_(std::move(config))
, registry_(std::make_shared<DeviceRegistry>())
, notifier_(std::make_shared<ChangeNotifier>())
, synchronizer_(std::make_shared<client::StateSynchronizer>(registry_, notifier_,
                                                             config_.offlineAfterMissedPolls))
{}

Client::~Client() {
    std::lock_guard lock(lifecycleMutex_);
    if (refCount_ > 0) {
        logWarning("[Client] destroyed with ", refCount_.load(), " active acquisition(s)\n");
        refCount_ = 0;
        stopLocked();
    }
}

expected<void> Client::acquire() {
    std::lock_guard lock(lifecycleMutex_);
    if (refCount_ == 0) {
        if (auto started = startLocked(); !started) {
            return started;
        }
    }
    ++refCount_;
    return {};
}

void Client::release() {
    std::lock_guard lock(lifecycleMutex_);
    if (refCount_ == 0) {
        logWarning("[Client] release() without a matching acquire() ignored\n");
        return;
    }
    if (--refCount_ == 0) {
        stopLocked();
    }
}

expected<void> Client::startLocked() {
    state_ = LifecycleState::Starting;
    logInfo("[Client] starting\n");

    auto fail = [this](const std::string& what, const std::error_code& ec) -> expected<void> {
        logError("[Client] ", what, ": ", ec.message(), "\n");
        state_ = LifecycleState::Stopped;
        return unexpected(make_error_code(ClientErrc::Socket));
    };

    std::error_code ec;
    const auto broadcast = net::ip::make_address_v4(config_.broadcastAddress, ec);
    if (ec) {
        return fail("invalid broadcast address '" + config_.broadcastAddress + "'", ec);
    }
    if (config_.families.empty()) {
        return fail("no device families configured",
                    std::make_error_code(std::errc::invalid_argument));
    }

    auto rt = std::make_shared<Runtime>();
    rt->net = std::make_unique<net::NetService>();
    auto io = rt->net->io();

    rt->pushSocket = std::make_shared<net::UdpSocket>(io);
    if ((ec = rt->pushSocket->open_and_bind(config_.listenPort, false))) {
        rt->closeSockets();
        return fail("cannot bind state port " + std::to_string(config_.listenPort), ec);
    }
    rt->pollSocket = std::make_shared<net::UdpSocket>(io);
    if ((ec = rt->pollSocket->open_and_bind(0, false))) {
        rt->closeSockets();
        return fail("cannot open poll socket", ec);
    }
    rt->discoverySocket = std::make_shared<net::UdpSocket>(io);
    if ((ec = rt->discoverySocket->open_and_bind(0, true))) {
        rt->closeSockets();
        return fail("cannot open discovery socket", ec);
    }
    auto commandSocket = std::make_shared<net::UdpSocket>(io);
    if ((ec = commandSocket->open_and_bind(0, false))) {
        rt->closeSockets();
        return fail("cannot open command socket", ec);
    }
    rt->transport = std::make_shared<client::UdpCommandTransport>(commandSocket, config_.sendTimeout);

    client::CommandOptions commandOptions;
    commandOptions.confirm = config_.confirmCommands;
    commandOptions.confirmTimeout = config_.commandConfirmTimeout;
    commandOptions.maxRetries = config_.commandMaxRetries;
    commandOptions.sendBackoff = config_.sendBackoff;
    rt->sender = std::make_shared<client::CommandSender>(registry_, notifier_, rt->transport,
                                                         config_.families, commandOptions);

    rt->push = std::make_unique<client::PushReceiver>(rt->pushSocket, synchronizer_,
                                                      config_.receiveSlice);

    client::PollTiming timing;
    timing.interval = config_.pollInterval;
    timing.replyTimeout = config_.pollReplyTimeout;
    timing.sendTimeout = config_.sendTimeout;
    timing.receiveSlice = config_.receiveSlice;
    rt->poll = std::make_unique<client::PollLoop>(rt->pollSocket, registry_, synchronizer_,
                                                  config_.families, timing);

    client::DiscoverySettings discovery;
    discovery.families = config_.families;
    discovery.broadcastAddress = broadcast;
    discovery.window = config_.discoveryWindow;
    discovery.sendTimeout = config_.sendTimeout;
    discovery.receiveSlice = config_.receiveSlice;
    rt->discovery = std::make_shared<client::DiscoveryListener>(io, rt->discoverySocket, registry_,
                                                                synchronizer_, discovery);

    rt->push->start();
    rt->poll->start();
    {
        std::lock_guard lock(runtimeMutex_);
        runtime_ = rt;
    }
    state_ = LifecycleState::Running;
    logInfo("[Client] running, state reports on port ", rt->pushSocket->local_port(), "\n");

    // The initial scan runs in the background; its result lands in the registry.
    rt->discovery->scan();
    return {};
}

void Client::stopLocked() {
    state_ = LifecycleState::Stopping;
    logInfo("[Client] stopping\n");

    std::shared_ptr<Runtime> rt;
    {
        std::lock_guard lock(runtimeMutex_);
        rt = std::move(runtime_);
    }
    if (!rt) {
        state_ = LifecycleState::Stopped;
        return;
    }

    const auto started = Clock::now();
    const auto deadline = started + config_.teardownDeadline;
    auto remaining = [&deadline] {
        return std::max(std::chrono::milliseconds::zero(),
                        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()));
    };

    rt->sender->cancelAll();
    rt->poll->stop(remaining());
    rt->push->stop(remaining());
    rt->discovery->shutdown(remaining());
    if (!rt->sender->waitIdle(remaining())) {
        logError("[Client] ", rt->sender->inFlight(), " command(s) still in flight at teardown\n");
    }
    rt->closeSockets();

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    if (elapsed > config_.teardownDeadline) {
        logError("[Client] teardown took ", elapsed.count(), "ms (limit ",
                 config_.teardownDeadline.count(), "ms)\n");
    }
    rt.reset();

    state_ = LifecycleState::Stopped;
    logInfo("[Client] stopped\n");
}

std::shared_ptr<Client::Runtime> Client::runtime() const {
    std::lock_guard lock(runtimeMutex_);
    return runtime_;
}

DeviceList Client::devices() const {
    return registry_->list();
}

std::optional<Device> Client::device(const Address& address) const {
    return registry_->get(address);
}

bool Client::removeDevice(const Address& address) {
    auto existing = registry_->get(address);
    if (!existing || !registry_->remove(address)) {
        return false;
    }
    if (auto rt = runtime()) {
        rt->sender->forget(address);
    }
    logInfo("[Client] removed ", address.to_string(), "\n");
    notifier_->publish(ChangeKind::DeviceRemoved, *existing);
    return true;
}

expected<void> Client::command(const Address& address, const Command& command) {
    auto rt = runtime();
    if (!rt) {
        return unexpected(make_error_code(ClientErrc::NotRunning));
    }
    return rt->sender->send(address, command);
}

expected<void> Client::command(const std::string& address, const Command& command) {
    std::error_code ec;
    const auto parsed = net::ip::make_address_v4(address, ec);
    if (ec) {
        logError("[Client] '", address, "' is not an IPv4 address\n");
        return unexpected(make_error_code(ClientErrc::UnknownDevice));
    }
    return this->command(parsed, command);
}

Subscription Client::subscribe(ChangeCallback callback) {
    return notifier_->subscribe(std::move(callback));
}

std::shared_future<client::DiscoveryResult> Client::rescan() {
    auto rt = runtime();
    if (!rt) {
        std::promise<client::DiscoveryResult> refused;
        refused.set_value(unexpected(make_error_code(ClientErrc::NotRunning)));
        return refused.get_future().share();
    }
    return rt->discovery->scan();
}

expected<Device> Client::probe(const Address& address) {
    auto rt = runtime();
    if (!rt) {
        return unexpected(make_error_code(ClientErrc::NotRunning));
    }
    return rt->discovery->probe(address, config_.probeTimeout);
}

bool Client::socketsOpen() const {
    auto rt = runtime();
    return rt && rt->pushSocket->is_open() && rt->pollSocket->is_open() &&
           rt->discoverySocket->is_open();
}

std::uint16_t Client::statePort() const {
    auto rt = runtime();
    return rt ? rt->pushSocket->local_port() : 0;
}

} // namespace pixelair
