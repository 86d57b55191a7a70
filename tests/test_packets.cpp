#include "pixelair/protocol/Packets.hpp"
#include "pixelair/log/Log.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace pixelair;
using namespace pixelair::protocol;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { pixelair::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { pixelair::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

using Bytes = std::vector<std::uint8_t>;

static void appendString(Bytes& out, const std::string& s) {
    out.push_back(static_cast<std::uint8_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

using Catalogue = std::vector<std::pair<std::string, std::string>>;

// counter=0x00000106, on, brightness 200, hue 300, saturation 80, effect, mode, catalogue
static Bytes lightBlock(const std::string& effect, std::uint16_t hue = 300, std::uint8_t saturation = 80,
                        std::uint8_t mode = 1, const Catalogue& effects = {}) {
    Bytes b = {0x00, 0x00, 0x01, 0x06, 0x01, 200,
               static_cast<std::uint8_t>(hue >> 8), static_cast<std::uint8_t>(hue & 0xFF),
               saturation};
    appendString(b, effect);
    b.push_back(mode);
    b.push_back(static_cast<std::uint8_t>(effects.size()));
    for (const auto& [id, name] : effects) {
        appendString(b, id);
        appendString(b, name);
    }
    return b;
}

static Bytes header(std::uint8_t type) {
    return {0x50, 0x58, 0x01, type};
}

static Bytes stateReport(const Bytes& light) {
    Bytes b = header(4);
    b.insert(b.end(), light.begin(), light.end());
    return b;
}

static void testDecodeStateReport() {
    auto raw = stateReport(lightBlock("scene:2"));
    auto packet = decodePacket(schema::ByteView(raw));
    ASSERT_TRUE(packet.has_value(), "state report decodes");
    const auto* report = std::get_if<StateReport>(&*packet);
    ASSERT_TRUE(report != nullptr, "decoded as state report");
    ASSERT_EQ(report->stateCounter, 0x106u, "big-endian counter");
    ASSERT_TRUE(report->state.on, "power on");
    ASSERT_EQ(report->state.brightness, std::uint8_t{200}, "brightness");
    ASSERT_EQ(report->state.hue, std::uint16_t{300}, "hue");
    ASSERT_EQ(report->state.saturation, std::uint8_t{80}, "saturation");
    ASSERT_TRUE(report->state.effect == std::optional<std::string>("scene:2"), "effect id");
    ASSERT_TRUE(report->state.mode == DeviceMode::Scene, "mode byte 1 is scene");
    ASSERT_TRUE(report->state.effects.empty(), "no catalogue entries");

    auto none = stateReport(lightBlock(""));
    auto decoded = decodePacket(schema::ByteView(none));
    ASSERT_TRUE(decoded && !std::get<StateReport>(*decoded).state.effect, "empty effect means none");
}

static void testDecodeAnnouncement() {
    Bytes raw = header(2);
    const Bytes mac = {0x24, 0x0a, 0xc4, 0x12, 0x34, 0x56};
    raw.insert(raw.end(), mac.begin(), mac.end());
    appendString(raw, "Monos");
    appendString(raw, "Kitchen");
    appendString(raw, "1.4.2");
    appendString(raw, "MN-42");
    auto light = lightBlock("auto", 300, 80, 0, {{"auto", "Auto"}, {"scene:0", "Sunset"}, {"manual:1", "Rainbow"}});
    raw.insert(raw.end(), light.begin(), light.end());

    auto packet = decodePacket(schema::ByteView(raw));
    ASSERT_TRUE(packet.has_value(), "announcement decodes");
    const auto* a = std::get_if<Announcement>(&*packet);
    ASSERT_TRUE(a != nullptr, "decoded as announcement");
    ASSERT_TRUE(formatMac(a->mac) == "24:0a:c4:12:34:56", "mac");
    ASSERT_TRUE(a->model == "Monos" && a->nickname == "Kitchen", "model and nickname");
    ASSERT_TRUE(a->firmwareVersion == "1.4.2" && a->serialNumber == "MN-42", "firmware and serial");
    ASSERT_EQ(a->stateCounter, 0x106u, "counter");
    ASSERT_TRUE(a->state.mode == DeviceMode::Auto, "mode byte 0 is auto");
    ASSERT_EQ(a->state.effects.size(), std::size_t{3}, "catalogue entries");
    ASSERT_TRUE(a->state.effects[1] == (Effect{"scene:0", "Sunset"}), "catalogue keeps wire order");
    ASSERT_TRUE(a->state.effectIdFor("Rainbow") == std::optional<std::string>("manual:1"),
                "display name resolves to effect id");
    ASSERT_TRUE(!a->state.effectIdFor("Disco"), "unknown display name");

    auto encoded = encodePacket(*a);
    ASSERT_TRUE(encoded && *encoded == raw, "encoder reproduces the wire bytes");
}

static void testHeaderOnlyPackets() {
    ASSERT_TRUE(encodePacket(DiscoveryRequest{}) == header(1), "discovery request bytes");
    ASSERT_TRUE(encodePacket(StateQuery{}) == header(3), "state query bytes");

    auto query = decodePacket(schema::ByteView(header(3)));
    ASSERT_TRUE(query && std::holds_alternative<StateQuery>(*query), "state query decodes");
}

static void expectRejected(const Bytes& raw, const char* what) {
    auto packet = decodePacket(schema::ByteView(raw));
    ASSERT_TRUE(!packet.has_value(), what);
}

static void testRejectMalformed() {
    expectRejected({}, "empty datagram");
    expectRejected({0x50, 0x59, 0x01, 0x04}, "wrong magic");
    expectRejected({0x50, 0x58, 0x02, 0x01}, "wrong version");
    expectRejected({0x50, 0x58, 0x01, 0x09}, "unknown type");
    expectRejected(stateReport(lightBlock("", 360)), "hue out of range");
    expectRejected(stateReport(lightBlock("", 10, 101)), "saturation out of range");

    auto badPower = stateReport(lightBlock(""));
    badPower[8] = 2;
    expectRejected(badPower, "power must be 0 or 1");

    auto trailing = stateReport(lightBlock(""));
    trailing.push_back(0);
    expectRejected(trailing, "trailing bytes");

    auto truncated = stateReport(lightBlock("auto"));
    truncated.resize(truncated.size() - 3);
    expectRejected(truncated, "effect length exceeds packet");

    expectRejected(stateReport(lightBlock("", 10, 10, 3)), "mode out of range");
    expectRejected(stateReport(lightBlock("", 10, 10, 2, {{"", "Blank"}})), "empty effect id");

    auto shortCatalogue = stateReport(lightBlock("", 10, 10, 2, {{"scene:0", "Sunset"}}));
    shortCatalogue[shortCatalogue.size() - 16] = 2;
    expectRejected(shortCatalogue, "catalogue shorter than its count");

    Bytes noModel = header(2);
    noModel.insert(noModel.end(), 6, 0x00);
    appendString(noModel, "");
    appendString(noModel, "n");
    appendString(noModel, "f");
    appendString(noModel, "s");
    auto light = lightBlock("");
    noModel.insert(noModel.end(), light.begin(), light.end());
    expectRejected(noModel, "empty model");

    auto error = decodePacket(schema::ByteView(Bytes{0x50, 0x58, 0x01, 0x04, 0x00}));
    ASSERT_TRUE(!error && error.error().where == "counter", "error names the failing field");
}

int main() {
    testDecodeStateReport();
    testDecodeAnnouncement();
    testHeaderOnlyPackets();
    testRejectMalformed();

    if (g_failures) {
        pixelair::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    pixelair::logInfo("Packet codec tests passed.\n");
    return 0;
}
