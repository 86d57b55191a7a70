#include "pixelair/core/ChangeNotifier.hpp"
#include "pixelair/log/Log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace pixelair {

struct Subscription::Listeners {
    struct Entry {
        std::uint64_t id;
        std::shared_ptr<ChangeCallback> callback;
    };

    std::mutex mutex;
    std::uint64_t nextId = 1;
    std::vector<Entry> entries;

    void remove(std::uint64_t id) {
        std::lock_guard lock(mutex);
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [id](const Entry& e) { return e.id == id; }),
                      entries.end());
    }

    bool contains(std::uint64_t id) {
        std::lock_guard lock(mutex);
        return std::any_of(entries.begin(), entries.end(),
                           [id](const Entry& e) { return e.id == id; });
    }
};

const char* toString(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::StateChanged:        return "state";
        case ChangeKind::AvailabilityChanged: return "availability";
        case ChangeKind::DeviceRemoved:       return "removed";
    }
    return "unknown";
}

Subscription::~Subscription() {
    unsubscribe();
}

Subscription::Subscription(Subscription&& other) noexcept
: listeners_(std::move(other.listeners_)), id_(std::exchange(other.id_, 0)) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        listeners_ = std::move(other.listeners_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void Subscription::unsubscribe() {
    if (id_ == 0) {
        return;
    }
    if (auto listeners = listeners_.lock()) {
        listeners->remove(id_);
    }
    listeners_.reset();
    id_ = 0;
}

bool Subscription::active() const {
    if (id_ == 0) {
        return false;
    }
    auto listeners = listeners_.lock();
    return listeners && listeners->contains(id_);
}

ChangeNotifier::ChangeNotifier() : listeners_(std::make_shared<Subscription::Listeners>()) {}

Subscription ChangeNotifier::subscribe(ChangeCallback callback) {
    if (!callback) {
        return {};
    }
    std::lock_guard lock(listeners_->mutex);
    const auto id = listeners_->nextId++;
    listeners_->entries.push_back({id, std::make_shared<ChangeCallback>(std::move(callback))});
    return Subscription(listeners_, id);
}

void ChangeNotifier::publish(const ChangeEvent& event) const {
    std::vector<std::shared_ptr<ChangeCallback>> callbacks;
    {
        std::lock_guard lock(listeners_->mutex);
        callbacks.reserve(listeners_->entries.size());
        for (const auto& entry : listeners_->entries) {
            callbacks.push_back(entry.callback);
        }
    }
    for (const auto& callback : callbacks) {
        try {
            (*callback)(event);
        } catch (const std::exception& ex) {
            logError("[ChangeNotifier] subscriber threw on ", toString(event.kind),
                     " event for ", event.device.address.to_string(), ": ", ex.what(), "\n");
        }
    }
}

void ChangeNotifier::publish(ChangeKind kind, const Device& device) const {
    publish(ChangeEvent{kind, device});
}

std::size_t ChangeNotifier::subscriberCount() const {
    std::lock_guard lock(listeners_->mutex);
    return listeners_->entries.size();
}

} // namespace pixelair
