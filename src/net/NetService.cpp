#include "pixelair/net/NetService.hpp"
#include "pixelair/log/Log.hpp"

namespace pixelair::net {

NetService::NetService()
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
, t_([this] { io_->run(); })
{
    logInfo("[NetService] I/O thread started\n");
}

NetService::~NetService() {
    work_guard_.reset();
    io_->stop();
    if (t_.joinable()) t_.join();
    logInfo("[NetService] I/O thread stopped\n");
}

} // namespace pixelair::net
