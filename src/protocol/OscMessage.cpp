#include "pixelair/protocol/OscMessage.hpp"
#include "pixelair/protocol/ByteBuffer.hpp"

#include <algorithm>
#include <cstring>

namespace pixelair::protocol {

namespace lsch = ::pixelair::schema;

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr float MAX_BRIGHTNESS = 255.0f;
constexpr float MAX_HUE = 360.0f;
constexpr float MAX_SATURATION = 100.0f;

// Read a NUL-terminated, 4-byte padded OSC string.
lsch::expected<std::string, lsch::DecodeError> readPaddedString(lsch::ByteView& s, const char* where) {
    const auto* begin = s.data();
    const auto* end = begin + s.size();
    const auto* nul = std::find(begin, end, std::uint8_t{0});
    if (nul == end) {
        return lsch::unexpected<lsch::DecodeError>({where, "unterminated string"});
    }
    const std::size_t length = static_cast<std::size_t>(nul - begin);
    const std::size_t padded = (length + 4) & ~static_cast<std::size_t>(3);
    if (padded > s.size()) {
        return lsch::unexpected<lsch::DecodeError>({where, "missing padding"});
    }
    std::string out(reinterpret_cast<const char*>(begin), length);
    s = s.subspan(padded);
    return out;
}

} // namespace

std::string OscMessage::typeTags() const {
    std::string tags(1, ',');
    for (const auto& arg : arguments) {
        std::visit(Overloaded{
            [&](std::int32_t) { tags.push_back('i'); },
            [&](float) { tags.push_back('f'); },
            [&](const std::string&) { tags.push_back('s'); }
        }, arg);
    }
    return tags;
}

std::vector<std::uint8_t> OscMessage::encode() const {
    ByteBuffer buffer;
    buffer.appendPaddedString(address);
    buffer.appendPaddedString(typeTags());
    for (const auto& arg : arguments) {
        std::visit(Overloaded{
            [&](std::int32_t v) { buffer.appendInt32(v); },
            [&](float v) { buffer.appendFloat32(v); },
            [&](const std::string& v) { buffer.appendPaddedString(v); }
        }, arg);
    }
    return buffer.bytes();
}

lsch::expected<OscMessage, lsch::DecodeError> OscMessage::decode(lsch::ByteView bytes) {
    if (bytes.size() % 4 != 0) {
        return lsch::unexpected<lsch::DecodeError>({"message", "size not a multiple of 4"});
    }
    auto cursor = bytes;
    OscMessage message;

    auto address = readPaddedString(cursor, "address");
    if (!address) return lsch::unexpected<lsch::DecodeError>(address.error());
    if (address->empty() || address->front() != '/') {
        return lsch::unexpected<lsch::DecodeError>({"address", "must start with '/'"});
    }
    message.address = std::move(*address);

    auto tags = readPaddedString(cursor, "typetags");
    if (!tags) return lsch::unexpected<lsch::DecodeError>(tags.error());
    if (tags->empty() || tags->front() != ',') {
        return lsch::unexpected<lsch::DecodeError>({"typetags", "must start with ','"});
    }

    for (std::size_t i = 1; i < tags->size(); ++i) {
        const char tag = (*tags)[i];
        if (tag == 's') {
            auto value = readPaddedString(cursor, "string argument");
            if (!value) return lsch::unexpected<lsch::DecodeError>(value.error());
            message.arguments.emplace_back(std::move(*value));
            continue;
        }
        auto raw = lsch::BeU32{}.read(cursor, "numeric argument");
        if (!raw) return lsch::unexpected<lsch::DecodeError>(raw.error());
        if (tag == 'i') {
            message.arguments.emplace_back(static_cast<std::int32_t>(*raw));
        } else if (tag == 'f') {
            float value = 0.0f;
            const std::uint32_t bits = *raw;
            std::memcpy(&value, &bits, sizeof(value));
            message.arguments.emplace_back(value);
        } else {
            return lsch::unexpected<lsch::DecodeError>(
                {"typetags", std::string("unsupported type tag '") + tag + "'"});
        }
    }

    if (!cursor.empty()) {
        return lsch::unexpected<lsch::DecodeError>({"message", "trailing bytes"});
    }
    return message;
}

OscMessage toOscMessage(const Command& command) {
    OscMessage message;
    std::visit(Overloaded{
        [&](const SetPower& c) {
            message.address = OSC_POWER;
            message.arguments.emplace_back(std::int32_t{c.on ? 1 : 0});
        },
        [&](const SetBrightness& c) {
            message.address = OSC_BRIGHTNESS;
            message.arguments.emplace_back(static_cast<float>(c.brightness) / MAX_BRIGHTNESS);
        },
        [&](const SetColor& c) {
            message.address = OSC_COLOR;
            const float hue = std::min(static_cast<float>(c.hue), MAX_HUE - 1.0f) / MAX_HUE;
            const float saturation = std::min(static_cast<float>(c.saturation), MAX_SATURATION) / MAX_SATURATION;
            message.arguments.emplace_back(hue);
            message.arguments.emplace_back(saturation);
        },
        [&](const SetEffect& c) {
            message.address = OSC_EFFECT;
            message.arguments.emplace_back(c.effectId);
        },
        [&](const SetMode& c) {
            message.address = OSC_MODE;
            message.arguments.emplace_back(static_cast<std::int32_t>(c.mode));
        }
    }, command);
    return message;
}

} // namespace pixelair::protocol
