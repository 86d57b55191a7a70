#pragma once

#include "pixelair/core/Device.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace pixelair {

enum class ChangeKind : std::uint8_t {
    StateChanged,        ///< light state or descriptive fields changed (device or optimistic)
    AvailabilityChanged, ///< Online <-> Offline
    DeviceRemoved
};

const char* toString(ChangeKind kind);

struct ChangeEvent {
    ChangeKind kind = ChangeKind::StateChanged;
    Device device;
};

using ChangeCallback = std::function<void(const ChangeEvent&)>;

class ChangeNotifier;

/**
 * @brief Handle returned by `ChangeNotifier::subscribe`.
 *
 * Unsubscribes on destruction or on `unsubscribe()`. Safe to outlive the
 * notifier. Move-only.
 */
class Subscription {
public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void unsubscribe();
    bool active() const;

private:
    friend class ChangeNotifier;
    struct Listeners;

    Subscription(std::weak_ptr<Listeners> listeners, std::uint64_t id)
    : listeners_(std::move(listeners)), id_(id) {}

    std::weak_ptr<Listeners> listeners_;
    std::uint64_t id_ = 0;
};

/**
 * @brief Observer list for registry changes.
 *
 * `publish` copies the callback list under the lock and invokes callbacks
 * outside it, on the publishing thread (push, poll, discovery or a consumer
 * issuing a command). A callback may subscribe or unsubscribe re-entrantly.
 */
class ChangeNotifier {
public:
    ChangeNotifier();

    [[nodiscard]] Subscription subscribe(ChangeCallback callback);
    void publish(const ChangeEvent& event) const;
    void publish(ChangeKind kind, const Device& device) const;
    std::size_t subscriberCount() const;

private:
    std::shared_ptr<Subscription::Listeners> listeners_;
};

} // namespace pixelair
