#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace pixelair::protocol {

/// Big-endian append-only buffer with the 4-byte alignment OSC requires.
class ByteBuffer {
public:
    ByteBuffer();

    void appendInt32(std::int32_t value);
    void appendUInt32(std::uint32_t value);
    void appendFloat32(float value);

    /// NUL-terminated string padded with NULs to a multiple of four bytes.
    void appendPaddedString(std::string_view value);
    void padToAlignment();

    const std::vector<std::uint8_t>& bytes() const { return buffer; }

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace pixelair::protocol
