#include "pixelair/core/DeviceRegistry.hpp"

namespace pixelair {

namespace {

template <typename T>
bool mergeField(T& target, const std::optional<T>& value) {
    if (!value || target == *value) {
        return false;
    }
    target = *value;
    return true;
}

bool mergeIdentity(Device& device, const DeviceFields& fields) {
    bool changed = false;
    changed |= mergeField(device.family, fields.family);
    changed |= mergeField(device.mac, fields.mac);
    changed |= mergeField(device.model, fields.model);
    changed |= mergeField(device.nickname, fields.nickname);
    changed |= mergeField(device.firmwareVersion, fields.firmwareVersion);
    changed |= mergeField(device.serialNumber, fields.serialNumber);
    return changed;
}

Device makeDevice(const Address& address) {
    Device device;
    device.address = address;
    return device;
}

} // namespace

DeviceList::DeviceList() : table_(std::make_shared<const Table>()) {}

const Device* DeviceList::find(const Address& address) const {
    auto it = table_->find(address);
    return it == table_->end() ? nullptr : &it->second;
}

DeviceRegistry::DeviceRegistry() : table_(std::make_shared<const Table>()) {}

std::shared_ptr<DeviceRegistry::Table> DeviceRegistry::mutableCopy() const {
    return std::make_shared<Table>(*table_);
}

bool DeviceRegistry::markAlive(Device& device, Clock::time_point now) {
    device.lastHeard = now;
    device.missedPolls = 0;
    if (device.availability == Availability::Offline) {
        device.availability = Availability::Online;
        return true;
    }
    return false;
}

UpsertOutcome DeviceRegistry::upsert(const Address& address, const DeviceFields& fields) {
    std::lock_guard lock(mutex_);
    auto next = mutableCopy();

    UpsertOutcome outcome;
    auto [it, inserted] = next->try_emplace(address, makeDevice(address));
    Device& device = it->second;
    outcome.created = inserted;

    const bool changed = mergeIdentity(device, fields) || inserted;
    outcome.changed = changed;
    outcome.device = device;

    if (changed) {
        table_ = std::move(next);
    }
    return outcome;
}

std::optional<Device> DeviceRegistry::get(const Address& address) const {
    std::lock_guard lock(mutex_);
    auto it = table_->find(address);
    if (it == table_->end()) {
        return std::nullopt;
    }
    return it->second;
}

DeviceList DeviceRegistry::list() const {
    std::lock_guard lock(mutex_);
    return DeviceList(table_);
}

bool DeviceRegistry::remove(const Address& address) {
    std::lock_guard lock(mutex_);
    if (table_->find(address) == table_->end()) {
        return false;
    }
    auto next = mutableCopy();
    next->erase(address);
    table_ = std::move(next);
    return true;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard lock(mutex_);
    return table_->size();
}

StateOutcome DeviceRegistry::applyState(const Address& address, std::uint32_t counter,
                                        const LightState& state, Clock::time_point now,
                                        const DeviceFields& identity) {
    std::lock_guard lock(mutex_);
    auto next = mutableCopy();

    StateOutcome outcome;
    auto [it, inserted] = next->try_emplace(address, makeDevice(address));
    Device& device = it->second;
    outcome.created = inserted;

    outcome.availabilityChanged = markAlive(device, now);

    if (!device.stateCounter || counter > *device.stateCounter) {
        device.stateCounter = counter;
        device.lightState = state;
        device.confirmedState = state;
        device.lastSeen = now;
        outcome.accepted = true;
        outcome.identityChanged = mergeIdentity(device, identity);
    }

    outcome.device = device;
    table_ = std::move(next);
    return outcome;
}

std::vector<Device> DeviceRegistry::recordMissedPolls(Clock::time_point roundStart,
                                                      unsigned threshold) {
    std::lock_guard lock(mutex_);
    auto next = mutableCopy();
    std::vector<Device> wentOffline;
    bool touched = false;

    for (auto& [address, device] : *next) {
        if (device.lastHeard >= roundStart) {
            continue;
        }
        ++device.missedPolls;
        touched = true;
        if (device.availability == Availability::Online && device.missedPolls >= threshold) {
            device.availability = Availability::Offline;
            wentOffline.push_back(device);
        }
    }

    if (touched) {
        table_ = std::move(next);
    }
    return wentOffline;
}

std::optional<Device> DeviceRegistry::applyOptimistic(const Address& address,
                                                      const LightState& state) {
    std::lock_guard lock(mutex_);
    if (table_->find(address) == table_->end()) {
        return std::nullopt;
    }
    auto next = mutableCopy();
    Device& device = next->at(address);
    device.lightState = state;
    Device snapshot = device;
    table_ = std::move(next);
    return snapshot;
}

std::optional<Device> DeviceRegistry::revertOptimistic(const Address& address,
                                                       std::optional<std::uint32_t> baseline) {
    std::lock_guard lock(mutex_);
    auto it = table_->find(address);
    if (it == table_->end()) {
        return std::nullopt;
    }
    const Device& current = it->second;
    if (current.stateCounter != baseline || current.lightState == current.confirmedState) {
        return std::nullopt;
    }
    auto next = mutableCopy();
    Device& device = next->at(address);
    device.lightState = device.confirmedState;
    Device snapshot = device;
    table_ = std::move(next);
    return snapshot;
}

} // namespace pixelair
