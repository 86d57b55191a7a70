#include "pixelair/client/PushReceiver.hpp"

#include "pixelair/core/PixelAirConfig.hpp"
#include "pixelair/log/Log.hpp"

#include <vector>

namespace pixelair::client {

PushReceiver::PushReceiver(std::shared_ptr<net::UdpSocket> socketValue,
                           std::shared_ptr<StateSynchronizer> synchronizerValue,
                           net::milliseconds receiveSliceValue)
: core::BackgroundWorker("PushReceiver")
, socket(std::move(socketValue))
, synchronizer(std::move(synchronizerValue))
, receiveSlice(receiveSliceValue)
{}

PushReceiver::~PushReceiver() {
    stop();
}

void PushReceiver::run() {
    logInfo("[PushReceiver] listening on port ", socket->local_port(), "\n");
    std::vector<std::uint8_t> buffer(config::MAX_DATAGRAM_SIZE);
    std::uint64_t received = 0;
    std::uint64_t malformed = 0;

    while (running) {
        net::udp::endpoint from;
        std::size_t n = 0;
        auto ec = socket->recv_from(buffer.data(), buffer.size(), from, n, receiveSlice);
        if (ec == net::asio::error::timed_out) {
            continue;
        }
        if (ec) {
            if (!running) {
                break;
            }
            logError("[PushReceiver] receive failed: ", ec.message(), "\n");
            sleepFor(receiveSlice);
            continue;
        }
        if (!from.address().is_v4()) {
            continue;
        }
        ++received;
        // Family stays as recorded by discovery.
        auto result = synchronizer->ingestDatagram(from.address().to_v4(),
                                                   schema::ByteView(buffer.data(), n),
                                                   std::string{}, Clock::now());
        if (!result) {
            ++malformed;
        }
    }
    logInfo("[PushReceiver] stopped after ", received, " datagram(s), ", malformed, " malformed\n");
}

} // namespace pixelair::client
