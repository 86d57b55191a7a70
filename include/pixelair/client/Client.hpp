#pragma once

#include "pixelair/client/DiscoveryListener.hpp"
#include "pixelair/core/ChangeNotifier.hpp"
#include "pixelair/core/Command.hpp"
#include "pixelair/core/DeviceRegistry.hpp"
#include "pixelair/core/Expected.hpp"
#include "pixelair/core/PixelAirConfig.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace pixelair {

enum class LifecycleState : std::uint8_t { Stopped, Starting, Running, Stopping };

const char* toString(LifecycleState state);

/**
 * @brief Shared, reference-counted entry point to the PixelAir devices.
 *
 * Every consumer calls `acquire()` once before use and `release()` when done.
 * The first acquisition opens the sockets and starts the push receiver, the
 * poll loop and an initial discovery scan; the last release stops them all and
 * closes every socket. The registry survives release/acquire cycles for the
 * lifetime of the Client object.
 *
 * Queries (`devices`, `device`, `subscribe`) work in any lifecycle state;
 * network operations (`command`, `rescan`, `probe`) need an acquired client
 * and fail with `NotRunning` otherwise. All methods may be called from any
 * thread.
 */
class Client {
public:
    explicit Client(ClientConfig config = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Returns `Socket` if the sockets could not be opened; the count is then unchanged.
    expected<void> acquire();
    void release();

    DeviceList devices() const;
    std::optional<Device> device(const Address& address) const;

    /// Forget a device. Publishes `DeviceRemoved`; false if it was unknown.
    bool removeDevice(const Address& address);

    expected<void> command(const Address& address, const Command& command);
    /// Same, with the address in dotted form; a malformed address is `UnknownDevice`.
    expected<void> command(const std::string& address, const Command& command);

    [[nodiscard]] Subscription subscribe(ChangeCallback callback);

    std::shared_future<client::DiscoveryResult> rescan();
    expected<Device> probe(const Address& address);

    std::size_t refCount() const { return refCount_.load(); }
    LifecycleState lifecycleState() const { return state_.load(); }
    bool socketsOpen() const;

    /// Bound state-report port, 0 while stopped.
    std::uint16_t statePort() const;

    const ClientConfig& config() const { return config_; }

private:
    struct Runtime;

    expected<void> startLocked();
    void stopLocked();
    std::shared_ptr<Runtime> runtime() const;

    ClientConfig config_;
    std::shared_ptr<DeviceRegistry> registry_;
    std::shared_ptr<ChangeNotifier> notifier_;
    std::shared_ptr<client::StateSynchronizer> synchronizer_;

    std::mutex lifecycleMutex_; ///< serialises acquire/release
    std::atomic<std::size_t> refCount_{0};
    std::atomic<LifecycleState> state_{LifecycleState::Stopped};

    mutable std::mutex runtimeMutex_;
    std::shared_ptr<Runtime> runtime_;
};

} // namespace pixelair
