#pragma once

#include <asio.hpp>       // standalone Asio
#include <chrono>
#include <system_error>   // std::error_code

namespace pixelair::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `pixelair::net::asio` as the standalone Asio namespace.
 * - `pixelair::net::udp` as the only protocol the PixelAir devices speak.
 */
namespace asio = ::asio;
namespace ip = ::asio::ip;

using udp = asio::ip::udp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace pixelair::net
