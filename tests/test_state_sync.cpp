#include "pixelair/client/StateSynchronizer.hpp"
#include "pixelair/core/ClientError.hpp"
#include "pixelair/log/Log.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace pixelair;
using namespace pixelair::client;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { pixelair::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { pixelair::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace {

const Address kDevice = net::ip::make_address_v4("10.0.0.7");

struct Harness {
    std::shared_ptr<DeviceRegistry> registry = std::make_shared<DeviceRegistry>();
    std::shared_ptr<ChangeNotifier> notifier = std::make_shared<ChangeNotifier>();
    StateSynchronizer sync{registry, notifier, 3};
    std::vector<ChangeEvent> events;
    Subscription subscription;

    Harness() {
        subscription = notifier->subscribe([this](const ChangeEvent& e) { events.push_back(e); });
    }

    std::size_t count(ChangeKind kind) const {
        std::size_t n = 0;
        for (const auto& e : events) {
            if (e.kind == kind) ++n;
        }
        return n;
    }
};

protocol::StateReport report(std::uint32_t counter, std::uint8_t brightness) {
    protocol::StateReport r;
    r.stateCounter = counter;
    r.state.on = true;
    r.state.brightness = brightness;
    return r;
}

} // namespace

static void testCounterScenario() {
    Harness h;
    const auto t0 = Clock::now();

    h.sync.ingestStateReport(kDevice, report(5, 50), t0);
    h.sync.ingestStateReport(kDevice, report(4, 40), t0 + std::chrono::milliseconds(10));
    h.sync.ingestStateReport(kDevice, report(6, 60), t0 + std::chrono::milliseconds(20));

    auto device = h.registry->get(kDevice);
    ASSERT_TRUE(device.has_value(), "device created by state report");
    ASSERT_EQ(*device->stateCounter, 6u, "final counter");
    ASSERT_EQ(device->lightState.brightness, std::uint8_t{60}, "final state from counter 6");
    ASSERT_EQ(h.count(ChangeKind::StateChanged), std::size_t{2}, "stale packet does not notify");
    ASSERT_EQ(h.count(ChangeKind::AvailabilityChanged), std::size_t{0}, "device never went offline");
}

static void testAnnouncementNotifiesOnce() {
    Harness h;
    protocol::Announcement a;
    a.mac = {0x24, 0x0a, 0xc4, 0x00, 0x00, 0x01};
    a.model = "Fluora";
    a.nickname = "Hall";
    a.firmwareVersion = "2.1.0";
    a.serialNumber = "FL-0001";
    a.stateCounter = 3;
    a.state.on = true;

    auto first = h.sync.ingestAnnouncement(kDevice, a, "fluora", Clock::now());
    ASSERT_TRUE(first.created && first.accepted, "announcement creates and applies");
    ASSERT_EQ(h.events.size(), std::size_t{1}, "one event for identity plus state");

    auto repeat = h.sync.ingestAnnouncement(kDevice, a, "fluora", Clock::now());
    ASSERT_TRUE(!repeat.accepted, "same counter is stale");
    ASSERT_EQ(h.events.size(), std::size_t{1}, "unchanged announcement is silent");

    a.nickname = "Hallway";
    a.stateCounter = 4;
    h.sync.ingestAnnouncement(kDevice, a, "fluora", Clock::now());
    ASSERT_EQ(h.events.size(), std::size_t{2}, "rename with a newer counter notifies once");
    auto device = h.registry->get(kDevice);
    ASSERT_TRUE(device->nickname == "Hallway", "nickname updated");
    ASSERT_TRUE(device->family == "fluora", "family recorded");
    ASSERT_TRUE(device->serialNumber == "FL-0001", "serial recorded");
}

static void testStaleAnnouncementLeavesIdentity() {
    Harness h;
    protocol::Announcement a;
    a.model = "Fluora";
    a.nickname = "Desk";
    a.stateCounter = 5;
    h.sync.ingestAnnouncement(kDevice, a, "fluora", Clock::now());
    const auto eventsBefore = h.events.size();

    protocol::Announcement stale = a;
    stale.model = "Monos";
    stale.nickname = "STALE";
    stale.stateCounter = 4;
    stale.state.brightness = 99;
    auto result = h.sync.ingestAnnouncement(kDevice, stale, "pixelair", Clock::now());

    ASSERT_TRUE(!result.accepted && !result.created, "older counter rejected");
    auto device = h.registry->get(kDevice);
    ASSERT_EQ(*device->stateCounter, 5u, "counter kept");
    ASSERT_TRUE(device->nickname == "Desk" && device->model == "Fluora", "identity kept");
    ASSERT_TRUE(device->family == "fluora", "family kept");
    ASSERT_EQ(device->lightState.brightness, std::uint8_t{0}, "state kept");
    ASSERT_EQ(h.events.size(), eventsBefore, "stale announcement is silent");
}

static void testOfflineAndBack() {
    Harness h;
    const auto t0 = Clock::now();
    h.sync.ingestStateReport(kDevice, report(1, 10), t0);

    auto interval = t0 + std::chrono::milliseconds(1);
    for (int i = 0; i < 2; ++i) {
        h.sync.completePollInterval(interval);
        ASSERT_TRUE(h.registry->get(kDevice)->isOnline(), "still online before the threshold");
    }
    h.sync.completePollInterval(interval);
    ASSERT_TRUE(!h.registry->get(kDevice)->isOnline(), "offline after three silent intervals");
    ASSERT_EQ(h.count(ChangeKind::AvailabilityChanged), std::size_t{1}, "one availability event");

    h.sync.completePollInterval(interval);
    ASSERT_EQ(h.count(ChangeKind::AvailabilityChanged), std::size_t{1}, "no repeat while offline");

    h.sync.ingestStateReport(kDevice, report(2, 20), Clock::now());
    ASSERT_TRUE(h.registry->get(kDevice)->isOnline(), "back online on a packet");
    ASSERT_EQ(h.count(ChangeKind::AvailabilityChanged), std::size_t{2}, "online transition notified");
    ASSERT_EQ(h.count(ChangeKind::StateChanged), std::size_t{2}, "state events separate from availability");
    ASSERT_TRUE(h.registry->size() == 1, "offline device retained");
}

static void testMalformedDatagramDropped() {
    Harness h;
    std::vector<std::string> errors;
    pixelair::setLogHandlers(nullptr, [&errors](std::string_view line) { errors.emplace_back(line); });

    const std::uint8_t junk[] = {0x50, 0x58, 0x01, 0x04, 0x00};
    auto result = h.sync.ingestDatagram(kDevice, schema::ByteView(junk, sizeof(junk)), "", Clock::now());
    pixelair::resetLogHandlers();

    ASSERT_EQ(errors.size(), std::size_t{1}, "malformed packet logged once");
    ASSERT_TRUE(!errors.empty() && errors.front().find("[StateSynchronizer]") == 0, "component prefix");
    ASSERT_TRUE(!errors.empty() && errors.front().find("counter") != std::string::npos,
                "log names the failing field");
    ASSERT_TRUE(!result, "truncated state report rejected");
    ASSERT_TRUE(result.error() == make_error_code(ClientErrc::MalformedPacket), "malformed error code");
    ASSERT_EQ(h.registry->size(), std::size_t{0}, "nothing registered");
    ASSERT_TRUE(h.events.empty(), "nothing published");
}

static void testDatagramRouting() {
    Harness h;
    auto bytes = protocol::encodePacket(report(9, 90));
    ASSERT_TRUE(bytes.has_value(), "encode report");
    auto result = h.sync.ingestDatagram(kDevice, schema::ByteView(*bytes), "", Clock::now());
    ASSERT_TRUE(result && result->accepted, "report routed through the gate");
    ASSERT_TRUE(result->type == protocol::PacketType::StateReport, "packet type reported");

    auto query = protocol::encodePacket(protocol::StateQuery{});
    auto ignored = h.sync.ingestDatagram(kDevice, schema::ByteView(query), "", Clock::now());
    ASSERT_TRUE(ignored && !ignored->accepted, "requests are ignored");
}

static void testSubscriptionLifetime() {
    auto notifier = std::make_shared<ChangeNotifier>();
    int calls = 0;
    {
        auto sub = notifier->subscribe([&calls](const ChangeEvent&) { ++calls; });
        ASSERT_TRUE(sub.active(), "subscription active");
        ASSERT_EQ(notifier->subscriberCount(), std::size_t{1}, "one subscriber");

        Subscription moved = std::move(sub);
        ASSERT_TRUE(!sub.active() && moved.active(), "move transfers the subscription");
        notifier->publish(ChangeKind::StateChanged, Device{});
        ASSERT_EQ(calls, 1, "callback invoked");

        moved.unsubscribe();
        ASSERT_TRUE(!moved.active(), "explicit unsubscribe");
        notifier->publish(ChangeKind::StateChanged, Device{});
        ASSERT_EQ(calls, 1, "no callback after unsubscribe");

        auto scoped = notifier->subscribe([&calls](const ChangeEvent&) { ++calls; });
    }
    ASSERT_EQ(notifier->subscriberCount(), std::size_t{0}, "destruction unsubscribes");

    auto orphan = notifier->subscribe([](const ChangeEvent&) {});
    notifier.reset();
    ASSERT_TRUE(!orphan.active(), "subscription outlives its notifier safely");
    orphan.unsubscribe();
}

static void testThrowingSubscriberIsContained() {
    Harness h;
    auto bad = h.notifier->subscribe([](const ChangeEvent&) { throw std::runtime_error("boom"); });
    pixelair::setLogHandler(pixelair::log::Level::Error, [](std::string_view) {});
    h.sync.ingestStateReport(kDevice, report(1, 1), Clock::now());
    pixelair::resetLogHandlers();
    ASSERT_EQ(h.count(ChangeKind::StateChanged), std::size_t{1}, "other subscribers still notified");
}

int main() {
    testCounterScenario();
    testAnnouncementNotifiesOnce();
    testStaleAnnouncementLeavesIdentity();
    testOfflineAndBack();
    testMalformedDatagramDropped();
    testDatagramRouting();
    testSubscriptionLifetime();
    testThrowingSubscriberIsContained();

    if (g_failures) {
        pixelair::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    pixelair::logInfo("State synchronizer tests passed.\n");
    return 0;
}
