#pragma once

#include "pixelair/client/CommandTransport.hpp"
#include "pixelair/core/ChangeNotifier.hpp"
#include "pixelair/core/Command.hpp"
#include "pixelair/core/DeviceRegistry.hpp"
#include "pixelair/core/Expected.hpp"
#include "pixelair/core/PixelAirConfig.hpp"

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace pixelair::client {

struct CommandOptions {
    bool confirm = true;
    std::chrono::milliseconds confirmTimeout = config::COMMAND_CONFIRM_TIMEOUT;
    unsigned maxRetries = config::COMMAND_MAX_RETRIES;
    std::chrono::milliseconds sendBackoff = config::SEND_BACKOFF;
};

/**
 * @brief Sends OSC commands with optimistic update, confirmation and retry.
 *
 * Per call:
 * 1. `UnknownDevice` if the address is not registered; nothing is sent.
 * 2. Wait for this device's lane: sends to one address leave in submission
 *    order, other addresses are not blocked.
 * 3. Apply the expected state to `lightState` and publish `StateChanged`.
 * 4. Send, then wait up to `confirmTimeout` for a state counter newer than the
 *    one seen before sending. Up to `1 + maxRetries` attempts in total; a
 *    failed send backs off linearly and counts as an attempt.
 * 5. On exhaustion revert `lightState` to `confirmedState` and return
 *    `CommandTimeout`, or `Socket` when the last attempt could not be sent.
 *
 * `cancelAll()` wakes every waiter; pending and future calls return `NotRunning`.
 */
class CommandSender {
public:
    CommandSender(std::shared_ptr<DeviceRegistry> registry,
                  std::shared_ptr<ChangeNotifier> notifier,
                  std::shared_ptr<CommandTransport> transport,
                  std::vector<DeviceFamily> families,
                  CommandOptions options);
    ~CommandSender();

    CommandSender(const CommandSender&) = delete;
    CommandSender& operator=(const CommandSender&) = delete;

    expected<void> send(const Address& address, const Command& command);

    void cancelAll();

    /// Wait until no call is inside `send`. Returns false on timeout.
    bool waitIdle(std::chrono::milliseconds deadline);

    std::size_t inFlight() const;

    /// Drop the lane of a removed device; a lane still in use goes when its last send leaves.
    void forget(const Address& address);

    /// Number of per-device lanes currently held.
    std::size_t laneCount() const;

private:
    struct Lane {
        std::mutex mutex;
        std::condition_variable turn;
        std::uint64_t nextTicket = 0;
        std::uint64_t serving = 0;
        std::size_t holders = 0; ///< guarded by Signal::mutex
    };

    class LaneTicket;

    struct Signal {
        std::mutex mutex;
        std::condition_variable changed;
    };

    std::shared_ptr<Lane> laneFor(const Address& address);
    void releaseLane(const Address& address, const std::shared_ptr<Lane>& lane);
    bool isCancelled() const;
    expected<void> deliver(const Address& address, const Command& command);
    bool waitForConfirmation(const Address& address, std::optional<std::uint32_t> baseline,
                             Clock::time_point deadline);
    bool backoff(std::chrono::milliseconds delay);
    void revert(const Address& address, std::optional<std::uint32_t> baseline);

    std::shared_ptr<DeviceRegistry> registry_;
    std::shared_ptr<ChangeNotifier> notifier_;
    std::shared_ptr<CommandTransport> transport_;
    std::vector<DeviceFamily> families_;
    CommandOptions options_;

    std::shared_ptr<Signal> signal_; ///< guards the members below
    std::map<Address, std::shared_ptr<Lane>> lanes_;
    std::size_t inFlight_ = 0;
    bool cancelled_ = false;
    Subscription subscription_;
};

} // namespace pixelair::client
