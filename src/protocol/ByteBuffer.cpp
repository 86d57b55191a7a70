#include "pixelair/protocol/ByteBuffer.hpp"

#include <cstring>

namespace pixelair::protocol {

namespace {
constexpr std::size_t OSC_ALIGNMENT = 4;
}

ByteBuffer::ByteBuffer() {
    buffer.reserve(64); // commands are a few dozen bytes
}

void ByteBuffer::appendUInt32(std::uint32_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void ByteBuffer::appendInt32(std::int32_t value) {
    appendUInt32(static_cast<std::uint32_t>(value));
}

void ByteBuffer::appendFloat32(float value) {
    static_assert(sizeof(float) == sizeof(std::uint32_t), "IEEE-754 single precision expected");
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    appendUInt32(bits);
}

void ByteBuffer::appendPaddedString(std::string_view value) {
    buffer.insert(buffer.end(), value.begin(), value.end());
    buffer.push_back(0);
    padToAlignment();
}

void ByteBuffer::padToAlignment() {
    while (buffer.size() % OSC_ALIGNMENT != 0) {
        buffer.push_back(0);
    }
}

} // namespace pixelair::protocol
