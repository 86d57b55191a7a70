#include "pixelair/client/CommandSender.hpp"

#include "pixelair/core/ClientError.hpp"
#include "pixelair/log/Log.hpp"
#include "pixelair/protocol/OscMessage.hpp"

namespace pixelair::client {

namespace {

bool counterAdvanced(const Device& device, std::optional<std::uint32_t> baseline) {
    if (!device.stateCounter) {
        return false;
    }
    return !baseline || *device.stateCounter > *baseline;
}

} // namespace

/// Holds one turn in a device lane; the next ticket is served on destruction.
/// The lane of a removed device is dropped when its last holder leaves.
class CommandSender::LaneTicket {
public:
    LaneTicket(CommandSender& sender, const Address& address)
    : sender_(sender), address_(address), lane_(sender.laneFor(address)) {
        std::unique_lock lock(lane_->mutex);
        const auto ticket = lane_->nextTicket++;
        lane_->turn.wait(lock, [&] { return lane_->serving == ticket; });
    }

    ~LaneTicket() {
        {
            std::lock_guard lock(lane_->mutex);
            ++lane_->serving;
        }
        lane_->turn.notify_all();
        sender_.releaseLane(address_, lane_);
    }

    LaneTicket(const LaneTicket&) = delete;
    LaneTicket& operator=(const LaneTicket&) = delete;

private:
    CommandSender& sender_;
    Address address_;
    std::shared_ptr<Lane> lane_;
};

CommandSender::CommandSender(std::shared_ptr<DeviceRegistry> registry,
                             std::shared_ptr<ChangeNotifier> notifier,
                             std::shared_ptr<CommandTransport> transport,
                             std::vector<DeviceFamily> families,
                             CommandOptions options)
: registry_(std::move(registry))
, notifier_(std::move(notifier))
, transport_(std::move(transport))
, families_(std::move(families))
, options_(options)
, signal_(std::make_shared<Signal>())
{
    // Confirmation waits re-check the registry whenever anything is published.
    // The callback owns the signal so a late publish never touches a dead sender.
    subscription_ = notifier_->subscribe([signal = signal_](const ChangeEvent&) {
        std::lock_guard lock(signal->mutex);
        signal->changed.notify_all();
    });
}

CommandSender::~CommandSender() {
    subscription_.unsubscribe();
    cancelAll();
    if (!waitIdle(config::TEARDOWN_DEADLINE)) {
        logError("[CommandSender] destroyed with ", inFlight(), " command(s) in flight\n");
    }
}

void CommandSender::cancelAll() {
    {
        std::lock_guard lock(signal_->mutex);
        cancelled_ = true;
    }
    signal_->changed.notify_all();
}

bool CommandSender::waitIdle(std::chrono::milliseconds deadline) {
    std::unique_lock lock(signal_->mutex);
    return signal_->changed.wait_for(lock, deadline, [this] { return inFlight_ == 0; });
}

std::size_t CommandSender::inFlight() const {
    std::lock_guard lock(signal_->mutex);
    return inFlight_;
}

bool CommandSender::isCancelled() const {
    std::lock_guard lock(signal_->mutex);
    return cancelled_;
}

std::shared_ptr<CommandSender::Lane> CommandSender::laneFor(const Address& address) {
    std::lock_guard lock(signal_->mutex);
    auto& lane = lanes_[address];
    if (!lane) {
        lane = std::make_shared<Lane>();
    }
    ++lane->holders;
    return lane;
}

void CommandSender::releaseLane(const Address& address, const std::shared_ptr<Lane>& lane) {
    std::lock_guard lock(signal_->mutex);
    // Lanes of removed devices go once nobody queues on them.
    if (--lane->holders > 0 || registry_->get(address)) {
        return;
    }
    auto it = lanes_.find(address);
    if (it != lanes_.end() && it->second == lane) {
        lanes_.erase(it);
    }
}

void CommandSender::forget(const Address& address) {
    std::lock_guard lock(signal_->mutex);
    auto it = lanes_.find(address);
    if (it != lanes_.end() && it->second->holders == 0) {
        lanes_.erase(it);
    }
}

std::size_t CommandSender::laneCount() const {
    std::lock_guard lock(signal_->mutex);
    return lanes_.size();
}

expected<void> CommandSender::send(const Address& address, const Command& command) {
    {
        std::lock_guard lock(signal_->mutex);
        if (cancelled_) {
            return unexpected(make_error_code(ClientErrc::NotRunning));
        }
        ++inFlight_;
    }

    auto result = deliver(address, command);

    {
        std::lock_guard lock(signal_->mutex);
        --inFlight_;
    }
    signal_->changed.notify_all();
    return result;
}

expected<void> CommandSender::deliver(const Address& address, const Command& command) {
    if (!registry_->get(address)) {
        logError("[CommandSender] ", describe(command), " for unknown device ",
                 address.to_string(), "\n");
        return unexpected(make_error_code(ClientErrc::UnknownDevice));
    }

    LaneTicket ticket(*this, address);

    // The device may have been removed while this call waited for its turn.
    auto device = registry_->get(address);
    if (!device) {
        return unexpected(make_error_code(ClientErrc::UnknownDevice));
    }
    if (isCancelled()) {
        return unexpected(make_error_code(ClientErrc::NotRunning));
    }

    const DeviceFamily* family = findFamily(families_, device->family);
    if (!family) {
        return unexpected(make_error_code(ClientErrc::UnknownDevice));
    }
    const net::udp::endpoint destination(address, family->commandPort);
    const auto payload = protocol::toOscMessage(command).encode();
    const auto baseline = device->stateCounter;

    if (auto updated = registry_->applyOptimistic(address, applyCommand(device->lightState, command))) {
        notifier_->publish(ChangeKind::StateChanged, *updated);
    }

    const unsigned attempts = 1 + options_.maxRetries;
    bool lastSendFailed = false;
    for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
        if (isCancelled()) {
            revert(address, baseline);
            return unexpected(make_error_code(ClientErrc::NotRunning));
        }

        if (auto ec = transport_->send(destination, payload)) {
            lastSendFailed = true;
            logError("[CommandSender] ", describe(command), " to ", address.to_string(),
                     " attempt ", attempt, "/", attempts, " not sent: ", ec.message(), "\n");
            if (attempt < attempts && !backoff(options_.sendBackoff * attempt)) {
                break;
            }
            continue;
        }
        lastSendFailed = false;

        if (!options_.confirm) {
            return {};
        }
        if (waitForConfirmation(address, baseline, Clock::now() + options_.confirmTimeout)) {
            return {};
        }
        if (!registry_->get(address)) {
            return unexpected(make_error_code(ClientErrc::UnknownDevice));
        }
        if (attempt < attempts) {
            logInfo("[CommandSender] ", describe(command), " to ", address.to_string(),
                    " unconfirmed, retrying (", attempt, "/", attempts, ")\n");
        }
    }

    revert(address, baseline);

    if (isCancelled()) {
        return unexpected(make_error_code(ClientErrc::NotRunning));
    }
    logError("[CommandSender] ", describe(command), " to ", address.to_string(), " failed after ",
             attempts, " attempt(s)\n");
    return unexpected(make_error_code(lastSendFailed ? ClientErrc::Socket
                                                     : ClientErrc::CommandTimeout));
}

bool CommandSender::waitForConfirmation(const Address& address,
                                        std::optional<std::uint32_t> baseline,
                                        Clock::time_point deadline) {
    std::unique_lock lock(signal_->mutex);
    bool confirmed = false;
    signal_->changed.wait_until(lock, deadline, [&] {
        if (cancelled_) {
            return true;
        }
        auto device = registry_->get(address);
        if (!device) {
            return true;
        }
        confirmed = counterAdvanced(*device, baseline);
        return confirmed;
    });
    return confirmed && !cancelled_;
}

bool CommandSender::backoff(std::chrono::milliseconds delay) {
    std::unique_lock lock(signal_->mutex);
    return !signal_->changed.wait_for(lock, delay, [this] { return cancelled_; });
}

void CommandSender::revert(const Address& address, std::optional<std::uint32_t> baseline) {
    if (auto reverted = registry_->revertOptimistic(address, baseline)) {
        logInfo("[CommandSender] reverted ", address.to_string(), " to ",
                reverted->lightState.describe(), "\n");
        notifier_->publish(ChangeKind::StateChanged, *reverted);
    }
}

} // namespace pixelair::client
