#pragma once

#include "pixelair/client/StateSynchronizer.hpp"
#include "pixelair/core/BackgroundWorker.hpp"
#include "pixelair/core/PixelAirConfig.hpp"
#include "pixelair/net/UdpSocket.hpp"

#include <memory>
#include <vector>

namespace pixelair::client {

struct PollTiming {
    net::milliseconds interval = config::POLL_INTERVAL;
    net::milliseconds replyTimeout = config::POLL_REPLY_TIMEOUT;
    net::milliseconds sendTimeout = config::SEND_TIMEOUT;
    net::milliseconds receiveSlice = config::RECEIVE_SLICE;
};

/**
 * @brief Fallback for missed pushes: queries every known device once per interval.
 *
 * Each device gets a state query on its family's command port and up to
 * `replyTimeout` for an answer. Anything else that arrives meanwhile is
 * ingested too. When an interval ends the synchronizer is told which devices
 * stayed silent, which drives offline detection.
 */
class PollLoop : public core::BackgroundWorker {
public:
    PollLoop(std::shared_ptr<net::UdpSocket> socket,
             std::shared_ptr<DeviceRegistry> registry,
             std::shared_ptr<StateSynchronizer> synchronizer,
             std::vector<DeviceFamily> families,
             PollTiming timing);
    ~PollLoop() override;

protected:
    void run() override;

private:
    /// Query every device once. Returns how many answered.
    std::size_t pollOnce();
    bool queryDevice(const Device& device);

    std::shared_ptr<net::UdpSocket> socket;
    std::shared_ptr<DeviceRegistry> registry;
    std::shared_ptr<StateSynchronizer> synchronizer;
    std::vector<DeviceFamily> families;
    PollTiming timing;
    std::vector<std::uint8_t> buffer;
};

} // namespace pixelair::client
