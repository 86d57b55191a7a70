#pragma once

#include "pixelair/core/Device.hpp"

#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace pixelair {

/**
 * @brief Immutable view of the registry at one instant.
 *
 * Taking a DeviceList costs one shared-pointer copy; the table it points at is
 * never modified afterwards, so it can be iterated any number of times and from
 * any thread while the registry keeps changing.
 */
class DeviceList {
public:
    using Table = std::map<Address, Device>;

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Device;
        using difference_type = std::ptrdiff_t;
        using pointer = const Device*;
        using reference = const Device&;

        const_iterator() = default;
        explicit const_iterator(Table::const_iterator it) : it_(it) {}

        reference operator*() const { return it_->second; }
        pointer operator->() const { return &it_->second; }
        const_iterator& operator++() { ++it_; return *this; }
        const_iterator operator++(int) { auto copy = *this; ++it_; return copy; }
        bool operator==(const const_iterator& other) const { return it_ == other.it_; }
        bool operator!=(const const_iterator& other) const { return it_ != other.it_; }

    private:
        Table::const_iterator it_{};
    };

    DeviceList();
    explicit DeviceList(std::shared_ptr<const Table> table) : table_(std::move(table)) {}

    const_iterator begin() const { return const_iterator(table_->begin()); }
    const_iterator end() const { return const_iterator(table_->end()); }
    std::size_t size() const { return table_->size(); }
    bool empty() const { return table_->empty(); }
    const Device* find(const Address& address) const;

private:
    std::shared_ptr<const Table> table_;
};

/// Result of an upsert: the merged record plus what happened to it.
struct UpsertOutcome {
    Device device;
    bool created = false;
    bool changed = false;
};

/// Result of feeding one state-carrying packet through the counter gate.
struct StateOutcome {
    Device device;
    bool accepted = false;            ///< counter advanced (or first state), state applied
    bool created = false;             ///< record did not exist before this packet
    bool availabilityChanged = false; ///< Offline -> Online
    bool identityChanged = false;     ///< accepted packet also changed identity fields
};

/**
 * @brief In-memory table of known devices keyed by address.
 *
 * All mutations take one mutex and publish a new copy of the table, so
 * readers always observe whole records. No method throws; `remove` of an
 * unknown address is a no-op.
 */
class DeviceRegistry {
public:
    DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    UpsertOutcome upsert(const Address& address, const DeviceFields& fields);
    std::optional<Device> get(const Address& address) const;
    DeviceList list() const;
    bool remove(const Address& address);
    std::size_t size() const;

    /**
     * @brief The single update rule shared by the push and poll paths.
     *
     * Applies `state`, and any `identity` fields an announcement carried, when
     * `counter` is greater than the stored counter or the device has none yet,
     * stamping `lastSeen` and marking the device Online. Both land in the same
     * table copy. A stale packet never touches the record's state, identity or
     * `lastSeen`; it only proves the device is alive (resets the missed-poll
     * count and revives an Offline device).
     */
    StateOutcome applyState(const Address& address, std::uint32_t counter,
                            const LightState& state, Clock::time_point now,
                            const DeviceFields& identity = {});

    /**
     * @brief Close a poll interval that started at `roundStart`.
     *
     * Every device not heard since `roundStart` gets one more missed poll;
     * devices reaching `threshold` go Offline and are returned.
     */
    std::vector<Device> recordMissedPolls(Clock::time_point roundStart, unsigned threshold);

    /// Set `lightState` without touching the counter or `confirmedState`.
    std::optional<Device> applyOptimistic(const Address& address, const LightState& state);

    /**
     * @brief Restore `lightState` to `confirmedState`, unless the counter moved
     * past `baseline` in the meantime. Returns the record only if it changed.
     */
    std::optional<Device> revertOptimistic(const Address& address,
                                           std::optional<std::uint32_t> baseline);

private:
    using Table = DeviceList::Table;

    /// Copy the current table for modification; caller holds `mutex_`.
    std::shared_ptr<Table> mutableCopy() const;

    static bool markAlive(Device& device, Clock::time_point now);

    mutable std::mutex mutex_;
    std::shared_ptr<const Table> table_;
};

} // namespace pixelair
