#pragma once

#include "pixelair/client/StateSynchronizer.hpp"
#include "pixelair/core/BackgroundWorker.hpp"
#include "pixelair/net/UdpSocket.hpp"

#include <memory>

namespace pixelair::client {

/// Receives unsolicited state reports on the client's listen port.
class PushReceiver : public core::BackgroundWorker {
public:
    PushReceiver(std::shared_ptr<net::UdpSocket> socket,
                 std::shared_ptr<StateSynchronizer> synchronizer,
                 net::milliseconds receiveSlice);
    ~PushReceiver() override;

protected:
    void run() override;

private:
    std::shared_ptr<net::UdpSocket> socket;
    std::shared_ptr<StateSynchronizer> synchronizer;
    net::milliseconds receiveSlice;
};

} // namespace pixelair::client
