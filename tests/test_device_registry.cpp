#include "pixelair/core/DeviceRegistry.hpp"
#include "pixelair/log/Log.hpp"

#include <atomic>
#include <thread>

using namespace pixelair;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { pixelair::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { pixelair::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static const Address kLamp = net::ip::make_address_v4("192.168.1.40");
static const Address kPanel = net::ip::make_address_v4("192.168.1.41");

static LightState makeState(bool on, std::uint8_t brightness) {
    LightState state;
    state.on = on;
    state.brightness = brightness;
    return state;
}

static void testUpsertCreatesThenMerges() {
    DeviceRegistry registry;

    DeviceFields fields;
    fields.model = "Fluora";
    fields.nickname = "Desk";
    auto first = registry.upsert(kLamp, fields);
    ASSERT_TRUE(first.created, "first upsert creates");
    ASSERT_TRUE(first.changed, "creation counts as change");
    ASSERT_TRUE(first.device.model == "Fluora", "model stored");

    auto same = registry.upsert(kLamp, fields);
    ASSERT_TRUE(!same.created && !same.changed, "identical upsert is a no-op");

    DeviceFields rename;
    rename.nickname = "Shelf";
    auto renamed = registry.upsert(kLamp, rename);
    ASSERT_TRUE(renamed.changed, "nickname change detected");
    ASSERT_TRUE(renamed.device.model == "Fluora", "unset fields keep their value");
    ASSERT_TRUE(renamed.device.nickname == "Shelf", "nickname merged");
    ASSERT_EQ(registry.size(), std::size_t{1}, "still one device");
}

static void testSnapshotIsolation() {
    DeviceRegistry registry;
    registry.upsert(kLamp, DeviceFields{});

    auto snapshot = registry.list();
    registry.upsert(kPanel, DeviceFields{});
    registry.remove(kLamp);

    ASSERT_EQ(snapshot.size(), std::size_t{1}, "snapshot unaffected by later mutations");
    ASSERT_TRUE(snapshot.find(kLamp) != nullptr, "snapshot keeps removed device");
    ASSERT_TRUE(snapshot.find(kPanel) == nullptr, "snapshot does not see new device");

    std::size_t passes = 0;
    for (int i = 0; i < 2; ++i) {
        for (const auto& device : snapshot) {
            ASSERT_TRUE(device.address == kLamp, "iteration yields the same record");
            ++passes;
        }
    }
    ASSERT_EQ(passes, std::size_t{2}, "snapshot is restartable");

    auto now = registry.list();
    ASSERT_EQ(now.size(), std::size_t{1}, "fresh snapshot sees current table");
    ASSERT_TRUE(now.find(kPanel) != nullptr, "fresh snapshot sees new device");
}

static void testRemoveUnknownIsNoop() {
    DeviceRegistry registry;
    ASSERT_TRUE(!registry.remove(kLamp), "remove of unknown address returns false");
    registry.upsert(kLamp, DeviceFields{});
    ASSERT_TRUE(registry.remove(kLamp), "remove of known address succeeds");
    ASSERT_TRUE(!registry.get(kLamp), "device gone");
}

static void testCounterGate() {
    DeviceRegistry registry;
    const auto t0 = Clock::now();

    auto first = registry.applyState(kLamp, 5, makeState(true, 100), t0);
    ASSERT_TRUE(first.accepted && first.created, "first state accepted and creates the device");

    auto stale = registry.applyState(kLamp, 4, makeState(false, 10), t0 + std::chrono::seconds(1));
    ASSERT_TRUE(!stale.accepted, "older counter rejected");
    ASSERT_TRUE(stale.device.lightState == makeState(true, 100), "stale packet leaves light state");
    ASSERT_TRUE(stale.device.lastSeen == t0, "stale packet leaves lastSeen");

    auto equal = registry.applyState(kLamp, 5, makeState(false, 10), t0);
    ASSERT_TRUE(!equal.accepted, "equal counter rejected");

    auto newer = registry.applyState(kLamp, 6, makeState(false, 10), t0 + std::chrono::seconds(2));
    ASSERT_TRUE(newer.accepted, "newer counter accepted");
    ASSERT_EQ(*newer.device.stateCounter, 6u, "counter advanced");
    ASSERT_TRUE(newer.device.confirmedState == makeState(false, 10), "confirmed state follows device");
}

static void testIdentityRidesOnAcceptedState() {
    DeviceRegistry registry;
    DeviceFields desk;
    desk.model = std::string("Fluora");
    desk.nickname = std::string("Desk");
    auto first = registry.applyState(kLamp, 5, makeState(true, 100), Clock::now(), desk);
    ASSERT_TRUE(first.accepted && first.identityChanged, "first announcement sets identity");

    DeviceFields stale;
    stale.model = std::string("Monos");
    stale.nickname = std::string("STALE");
    auto rejected = registry.applyState(kLamp, 4, makeState(false, 1), Clock::now(), stale);
    ASSERT_TRUE(!rejected.accepted && !rejected.identityChanged, "stale identity rejected");
    ASSERT_TRUE(registry.get(kLamp)->nickname == "Desk", "nickname untouched");
    ASSERT_TRUE(registry.get(kLamp)->model == "Fluora", "model untouched");

    auto renamed = registry.applyState(kLamp, 6, makeState(true, 100), Clock::now(), stale);
    ASSERT_TRUE(renamed.accepted && renamed.identityChanged, "newer counter carries the rename");
    ASSERT_TRUE(renamed.device.nickname == "STALE", "renamed in the same update");
}

static void testOptimisticAndRevert() {
    DeviceRegistry registry;
    registry.applyState(kLamp, 7, makeState(true, 200), Clock::now());

    auto optimistic = registry.applyOptimistic(kLamp, makeState(true, 128));
    ASSERT_TRUE(optimistic.has_value(), "optimistic update on known device");
    ASSERT_EQ(optimistic->lightState.brightness, std::uint8_t{128}, "optimistic brightness");
    ASSERT_EQ(optimistic->confirmedState.brightness, std::uint8_t{200}, "confirmed untouched");

    auto reverted = registry.revertOptimistic(kLamp, 7u);
    ASSERT_TRUE(reverted.has_value(), "revert restores confirmed state");
    ASSERT_EQ(reverted->lightState.brightness, std::uint8_t{200}, "brightness back to confirmed");

    registry.applyOptimistic(kLamp, makeState(false, 0));
    registry.applyState(kLamp, 8, makeState(true, 50), Clock::now());
    ASSERT_TRUE(!registry.revertOptimistic(kLamp, 7u), "no revert once the device reported newer state");
    ASSERT_EQ(registry.get(kLamp)->lightState.brightness, std::uint8_t{50}, "device report wins");

    ASSERT_TRUE(!registry.applyOptimistic(kPanel, makeState(true, 1)), "unknown device not created");
}

static void testMissedPolls() {
    DeviceRegistry registry;
    const auto t0 = Clock::now();
    registry.applyState(kLamp, 1, makeState(true, 1), t0);
    registry.applyState(kPanel, 1, makeState(true, 1), t0);

    // Interval 1 starts just after both devices were heard; nobody speaks in it.
    ASSERT_TRUE(registry.recordMissedPolls(t0 + std::chrono::milliseconds(1), 2).empty(),
                "one miss is not enough");

    // Interval 2: only the panel answers, with a counter it already sent.
    const auto second = t0 + std::chrono::seconds(30);
    registry.applyState(kPanel, 1, makeState(true, 1), second + std::chrono::seconds(1));
    auto offline = registry.recordMissedPolls(second, 2);
    ASSERT_EQ(offline.size(), std::size_t{1}, "only the silent device goes offline");
    ASSERT_TRUE(offline.front().address == kLamp, "lamp is offline");
    ASSERT_TRUE(registry.get(kPanel)->isOnline(), "stale-but-alive panel stays online");
    ASSERT_EQ(registry.get(kPanel)->missedPolls, 0u, "panel miss count reset");
}

static void testConcurrentReaders() {
    DeviceRegistry registry;
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread reader([&] {
        while (!done) {
            for (const auto& device : registry.list()) {
                if (device.stateCounter && device.lightState.brightness != *device.stateCounter % 256) {
                    ++torn;
                }
            }
        }
    });

    for (std::uint32_t i = 1; i < 2000; ++i) {
        registry.applyState(kLamp, i, makeState(true, static_cast<std::uint8_t>(i % 256)), Clock::now());
    }
    done = true;
    reader.join();
    ASSERT_EQ(torn.load(), 0, "readers only see whole records");
}

int main() {
    testUpsertCreatesThenMerges();
    testSnapshotIsolation();
    testRemoveUnknownIsNoop();
    testCounterGate();
    testIdentityRidesOnAcceptedState();
    testOptimisticAndRevert();
    testMissedPolls();
    testConcurrentReaders();

    if (g_failures) {
        pixelair::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    pixelair::logInfo("All device registry tests passed.\n");
    return 0;
}
