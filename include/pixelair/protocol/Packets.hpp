// Packets.hpp
// -----------------------------------------------------------------------------
// Binary discovery / state packets exchanged with PixelAir devices.
//
// Every packet starts with a 4-byte header:
//   magic u16 (0x5058, "PX") | version u8 (1) | type u8
// followed by a type-specific body (big-endian):
//   DiscoveryRequest, StateQuery : empty
//   Announcement : mac[6] model nickname firmware serial counter:u32 <light>
//   StateReport  : counter:u32 <light>
//   <light>      : power:u8(0/1) brightness:u8 hue:u16(<=359) saturation:u8(<=100) effect
//                  mode:u8(0 auto, 1 scene, 2 manual) count:u8 count x (effect-id effect-name)
// Strings are one-byte length prefixed; an empty effect means "no effect".

#pragma once

#include "pixelair/core/Device.hpp"
#include "pixelair/schema/pixelair_schema.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace pixelair::protocol {

constexpr std::uint16_t PACKET_MAGIC = 0x5058;
constexpr std::uint8_t PROTOCOL_VERSION = 1;
constexpr std::size_t HEADER_SIZE = 4;

enum class PacketType : std::uint8_t {
    DiscoveryRequest = 1,
    Announcement = 2,
    StateQuery = 3,
    StateReport = 4
};

struct DiscoveryRequest {};
struct StateQuery {};

struct Announcement {
    MacAddress mac{};
    std::string model;
    std::string nickname;
    std::string firmwareVersion;
    std::string serialNumber;
    std::uint32_t stateCounter = 0;
    LightState state;
};

struct StateReport {
    std::uint32_t stateCounter = 0;
    LightState state;
};

using Packet = std::variant<DiscoveryRequest, Announcement, StateQuery, StateReport>;

/// Decode one datagram. The whole buffer must be consumed.
schema::expected<Packet, schema::DecodeError> decodePacket(schema::ByteView bytes);

schema::Bytes encodePacket(const DiscoveryRequest& packet);
schema::Bytes encodePacket(const StateQuery& packet);
schema::expected<schema::Bytes, schema::DecodeError> encodePacket(const Announcement& packet);
schema::expected<schema::Bytes, schema::DecodeError> encodePacket(const StateReport& packet);

const char* toString(PacketType type);

} // namespace pixelair::protocol
