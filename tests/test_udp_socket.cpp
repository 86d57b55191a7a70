#include "pixelair/log/Log.hpp"
#include "pixelair/net/NetService.hpp"
#include "pixelair/net/UdpSocket.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace pixelair;
using namespace std::chrono_literals;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { pixelair::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { pixelair::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace {

const auto kLoopback = net::ip::make_address_v4("127.0.0.1");

// Buffer and endpoint live only for the duration of this call.
net::error_code receiveOnce(net::UdpSocket& socket, std::string& out, net::milliseconds timeout) {
    std::vector<std::uint8_t> buffer(64, 0xEE);
    net::udp::endpoint from;
    std::size_t n = 0;
    auto ec = socket.recv_from(buffer.data(), buffer.size(), from, n, timeout);
    out.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n));
    return ec;
}

void sendText(net::UdpSocket& from, const net::UdpSocket& to, const std::string& text) {
    const net::udp::endpoint target(kLoopback, to.local_port());
    auto ec = from.send_to(text.data(), text.size(), target, 200ms);
    ASSERT_TRUE(!ec, "loopback send");
}

} // namespace

static void testTimedOutSlicesReleaseTheBuffer() {
    net::NetService service;
    net::UdpSocket receiver(service.io());
    net::UdpSocket sender(service.io());
    ASSERT_TRUE(!receiver.open_and_bind(0, false), "bind receiver");
    ASSERT_TRUE(!sender.open_and_bind(0, false), "bind sender");

    int timeouts = 0;
    for (int i = 0; i < 20; ++i) {
        std::string text;
        auto ec = receiveOnce(receiver, text, 5ms);
        if (ec == net::error_code(asio::error::timed_out) && text.empty()) {
            ++timeouts;
        }
    }
    ASSERT_EQ(timeouts, 20, "silent socket times out every slice with no bytes");

    sendText(sender, receiver, "after-slices");
    std::string text;
    auto ec = receiveOnce(receiver, text, 500ms);
    ASSERT_TRUE(!ec, "datagram after timed-out slices is received");
    ASSERT_TRUE(text == "after-slices", "payload intact");
}

static void testQueuedDatagramBeatsExpiredDeadline() {
    net::NetService service;
    net::UdpSocket receiver(service.io());
    net::UdpSocket sender(service.io());
    ASSERT_TRUE(!receiver.open_and_bind(0, false), "bind receiver");
    ASSERT_TRUE(!sender.open_and_bind(0, false), "bind sender");

    sendText(sender, receiver, "report");
    std::this_thread::sleep_for(20ms);

    // The deadline has already passed when the receive starts, but the
    // datagram is waiting on the socket and must not be reported as a timeout.
    std::string text;
    auto ec = receiveOnce(receiver, text, 0ms);
    ASSERT_TRUE(!ec, "queued datagram returned despite an expired deadline");
    ASSERT_TRUE(text == "report", "queued payload");

    ec = receiveOnce(receiver, text, 0ms);
    ASSERT_TRUE(ec == net::error_code(asio::error::timed_out), "empty socket still times out");
}

int main() {
    testTimedOutSlicesReleaseTheBuffer();
    testQueuedDatagramBeatsExpiredDeadline();

    if (g_failures) {
        pixelair::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    pixelair::logInfo("UDP socket deadline tests passed.\n");
    return 0;
}
