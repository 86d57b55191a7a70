#include "pixelair/client/CommandTransport.hpp"

namespace pixelair::client {

UdpCommandTransport::UdpCommandTransport(std::shared_ptr<net::UdpSocket> socket,
                                         net::milliseconds sendTimeout)
: socket_(std::move(socket)), sendTimeout_(sendTimeout) {}

net::error_code UdpCommandTransport::send(const net::udp::endpoint& destination,
                                          const std::vector<std::uint8_t>& payload) {
    std::lock_guard lock(mutex_);
    if (!socket_ || !socket_->is_open()) {
        return net::asio::error::bad_descriptor;
    }
    return socket_->send_to(payload.data(), payload.size(), destination, sendTimeout_);
}

void UdpCommandTransport::close() {
    std::lock_guard lock(mutex_);
    if (socket_) {
        socket_->close();
    }
}

} // namespace pixelair::client
