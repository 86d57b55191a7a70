#include "pixelair/protocol/Packets.hpp"

namespace pixelair::protocol {

namespace lsch = ::pixelair::schema;

namespace {

// --- Wire models -------------------------------------------------------------
struct HeaderWire {
    std::uint16_t magic = PACKET_MAGIC;
    std::uint8_t version = PROTOCOL_VERSION;
    PacketType type = PacketType::DiscoveryRequest;
};

struct IdentityWire {
    MacAddress mac{};
    std::string model;
    std::string nickname;
    std::string firmwareVersion;
    std::string serialNumber;
};

struct LightWire {
    std::uint32_t counter = 0;
    bool power = false;
    std::uint8_t brightness = 0;
    std::uint16_t hue = 0;
    std::uint8_t saturation = 0;
    std::string effect;
    DeviceMode mode = DeviceMode::Auto;
};

struct EffectWire {
    std::string id;
    std::string displayName;
};

// --- Schemas -----------------------------------------------------------------
const auto headerSchema = lsch::makeSchema<HeaderWire>(std::make_tuple(
    lsch::field<&HeaderWire::magic  >("magic"  , lsch::BeU16{}, lsch::Equals<PACKET_MAGIC>{}),
    lsch::field<&HeaderWire::version>("version", lsch::BeU8{} , lsch::Equals<PROTOCOL_VERSION>{}),
    lsch::field<&HeaderWire::type   >("type"   , lsch::BeU8{} , lsch::InRange<1, 4>{})
));

const auto identitySchema = lsch::makeSchema<IdentityWire>(std::make_tuple(
    lsch::field<&IdentityWire::mac            >("mac"     , lsch::FixedBytes<6>{}),
    lsch::field<&IdentityWire::model          >("model"   , lsch::PrefixedString{}, lsch::NotEmpty{}),
    lsch::field<&IdentityWire::nickname       >("nickname", lsch::PrefixedString{}),
    lsch::field<&IdentityWire::firmwareVersion>("firmware", lsch::PrefixedString{}),
    lsch::field<&IdentityWire::serialNumber   >("serial"  , lsch::PrefixedString{})
));

const auto lightSchema = lsch::makeSchema<LightWire>(std::make_tuple(
    lsch::field<&LightWire::counter   >("counter"   , lsch::BeU32{}),
    lsch::field<&LightWire::power     >("power"     , lsch::BoolU8{}),
    lsch::field<&LightWire::brightness>("brightness", lsch::BeU8{}),
    lsch::field<&LightWire::hue       >("hue"       , lsch::BeU16{}, lsch::InRange<0, 359>{}),
    lsch::field<&LightWire::saturation>("saturation", lsch::BeU8{} , lsch::InRange<0, 100>{}),
    lsch::field<&LightWire::effect    >("effect"    , lsch::PrefixedString{}),
    lsch::field<&LightWire::mode      >("mode"      , lsch::BeU8{} , lsch::InRange<0, 2>{})
));

const auto effectSchema = lsch::makeSchema<EffectWire>(std::make_tuple(
    lsch::field<&EffectWire::id         >("effect id"  , lsch::PrefixedString{}, lsch::NotEmpty{}),
    lsch::field<&EffectWire::displayName>("effect name", lsch::PrefixedString{}, lsch::NotEmpty{})
));

constexpr std::size_t MAX_EFFECTS = 255;

// --- Conversions -------------------------------------------------------------
LightWire toWire(std::uint32_t counter, const LightState& state) {
    LightWire wire;
    wire.counter = counter;
    wire.power = state.on;
    wire.brightness = state.brightness;
    wire.hue = state.hue;
    wire.saturation = state.saturation;
    wire.effect = state.effect.value_or(std::string{});
    wire.mode = state.mode;
    return wire;
}

LightState fromWire(const LightWire& wire) {
    LightState state;
    state.on = wire.power;
    state.brightness = wire.brightness;
    state.hue = wire.hue;
    state.saturation = wire.saturation;
    if (!wire.effect.empty()) {
        state.effect = wire.effect;
    }
    state.mode = wire.mode;
    return state;
}

// Light block: fixed fields, then a one-byte count of (id, name) effect entries.
lsch::expected<std::pair<std::uint32_t, LightState>, lsch::DecodeError>
decodeLight(lsch::ByteView& cursor) {
    auto light = lsch::decodeFrom(lightSchema, cursor);
    if (!light) return lsch::unexpected<lsch::DecodeError>(light.error());
    auto count = lsch::BeU8{}.read(cursor, "effect count");
    if (!count) return lsch::unexpected<lsch::DecodeError>(count.error());

    auto state = fromWire(*light);
    state.effects.reserve(*count);
    for (std::size_t i = 0; i < *count; ++i) {
        auto entry = lsch::decodeFrom(effectSchema, cursor);
        if (!entry) return lsch::unexpected<lsch::DecodeError>(entry.error());
        state.effects.push_back(Effect{std::move(entry->id), std::move(entry->displayName)});
    }
    return std::make_pair(light->counter, std::move(state));
}

lsch::expected<void, lsch::DecodeError>
encodeLight(std::uint32_t counter, const LightState& state, lsch::Bytes& out) {
    if (state.effects.size() > MAX_EFFECTS) {
        return lsch::unexpected<lsch::DecodeError>(
            {"effect count", std::to_string(state.effects.size()) + " exceeds 255"});
    }
    lsch::Bytes staged;
    if (auto ok = lsch::encodeInto(lightSchema, toWire(counter, state), staged); !ok) {
        return lsch::unexpected<lsch::DecodeError>(ok.error());
    }
    lsch::BeU8{}.write(static_cast<std::uint8_t>(state.effects.size()), staged);
    for (const auto& entry : state.effects) {
        if (auto ok = lsch::encodeInto(effectSchema, EffectWire{entry.id, entry.displayName}, staged); !ok) {
            return lsch::unexpected<lsch::DecodeError>(ok.error());
        }
    }
    out.insert(out.end(), staged.begin(), staged.end());
    return {};
}

lsch::Bytes headerOnly(PacketType type) {
    lsch::Bytes out;
    out.reserve(HEADER_SIZE);
    lsch::BeU16{}.write(PACKET_MAGIC, out);
    lsch::BeU8{}.write(PROTOCOL_VERSION, out);
    lsch::BeU8{}.write(static_cast<std::uint8_t>(type), out);
    return out;
}

lsch::expected<void, lsch::DecodeError> requireEnd(const lsch::ByteView& cursor) {
    if (!cursor.empty()) {
        return lsch::unexpected<lsch::DecodeError>(
            {"packet", std::to_string(cursor.size()) + " trailing bytes"});
    }
    return {};
}

} // namespace

lsch::expected<Packet, lsch::DecodeError> decodePacket(lsch::ByteView bytes) {
    auto cursor = bytes;
    auto header = lsch::decodeFrom(headerSchema, cursor);
    if (!header) {
        return lsch::unexpected<lsch::DecodeError>(header.error());
    }

    switch (header->type) {
        case PacketType::DiscoveryRequest:
        case PacketType::StateQuery: {
            if (auto end = requireEnd(cursor); !end) {
                return lsch::unexpected<lsch::DecodeError>(end.error());
            }
            if (header->type == PacketType::DiscoveryRequest) {
                return Packet{DiscoveryRequest{}};
            }
            return Packet{StateQuery{}};
        }
        case PacketType::Announcement: {
            auto identity = lsch::decodeFrom(identitySchema, cursor);
            if (!identity) return lsch::unexpected<lsch::DecodeError>(identity.error());
            auto light = decodeLight(cursor);
            if (!light) return lsch::unexpected<lsch::DecodeError>(light.error());
            if (auto end = requireEnd(cursor); !end) {
                return lsch::unexpected<lsch::DecodeError>(end.error());
            }

            Announcement announcement;
            announcement.mac = identity->mac;
            announcement.model = std::move(identity->model);
            announcement.nickname = std::move(identity->nickname);
            announcement.firmwareVersion = std::move(identity->firmwareVersion);
            announcement.serialNumber = std::move(identity->serialNumber);
            announcement.stateCounter = light->first;
            announcement.state = std::move(light->second);
            return Packet{std::move(announcement)};
        }
        case PacketType::StateReport: {
            auto light = decodeLight(cursor);
            if (!light) return lsch::unexpected<lsch::DecodeError>(light.error());
            if (auto end = requireEnd(cursor); !end) {
                return lsch::unexpected<lsch::DecodeError>(end.error());
            }
            return Packet{StateReport{light->first, std::move(light->second)}};
        }
    }
    return lsch::unexpected<lsch::DecodeError>({"type", "unhandled packet type"});
}

lsch::Bytes encodePacket(const DiscoveryRequest&) {
    return headerOnly(PacketType::DiscoveryRequest);
}

lsch::Bytes encodePacket(const StateQuery&) {
    return headerOnly(PacketType::StateQuery);
}

lsch::expected<lsch::Bytes, lsch::DecodeError> encodePacket(const Announcement& packet) {
    auto out = headerOnly(PacketType::Announcement);
    IdentityWire identity{packet.mac, packet.model, packet.nickname,
                          packet.firmwareVersion, packet.serialNumber};
    if (auto ok = lsch::encodeInto(identitySchema, identity, out); !ok) {
        return lsch::unexpected<lsch::DecodeError>(ok.error());
    }
    if (auto ok = encodeLight(packet.stateCounter, packet.state, out); !ok) {
        return lsch::unexpected<lsch::DecodeError>(ok.error());
    }
    return out;
}

lsch::expected<lsch::Bytes, lsch::DecodeError> encodePacket(const StateReport& packet) {
    auto out = headerOnly(PacketType::StateReport);
    if (auto ok = encodeLight(packet.stateCounter, packet.state, out); !ok) {
        return lsch::unexpected<lsch::DecodeError>(ok.error());
    }
    return out;
}

const char* toString(PacketType type) {
    switch (type) {
        case PacketType::DiscoveryRequest: return "discovery-request";
        case PacketType::Announcement:     return "announcement";
        case PacketType::StateQuery:       return "state-query";
        case PacketType::StateReport:      return "state-report";
    }
    return "unknown";
}

} // namespace pixelair::protocol
