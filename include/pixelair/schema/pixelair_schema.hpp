#pragma once
// pixelair_schema.hpp (C++17, header-only)
// -----------------------------------------------------------------------------
// Declarative binary packet schemas with safe decode/encode.
//
// A schema is a tuple of fields (member pointer + codec + validators) and an
// optional object-level validator:
//
//   struct Report { uint32_t counter; uint8_t power; std::string effect; };
//   using namespace pixelair::schema;
//   const auto reportSchema = makeSchema<Report>(std::make_tuple(
//       field<&Report::counter>("counter", BeU32{}),
//       field<&Report::power  >("power"  , BeU8{}, InRange<0, 1>{}),
//       field<&Report::effect >("effect" , PrefixedString{})));
//
//   auto cursor = ByteView(bytes);
//   auto report = decodeFrom(reportSchema, cursor);   // advances cursor
//   auto whole  = decode(reportSchema, ByteView(bytes)); // rejects trailing bytes
//   auto blob   = encode(reportSchema, report.value());
//
// Multi-byte integers are big-endian (network order).
// -----------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

namespace pixelair::schema {

template<class T, class E>
using expected = tl::expected<T, E>;
template<class E>
using unexpected = tl::unexpected<E>;

// Read-only byte slice over a datagram.
struct ByteView {
    const std::uint8_t* ptr = nullptr;
    std::size_t len = 0;

    ByteView() = default;
    ByteView(const std::uint8_t* p, std::size_t n) : ptr(p), len(n) {}

    template<class Container>
    explicit ByteView(const Container& c)
    : ptr(reinterpret_cast<const std::uint8_t*>(c.data())), len(c.size()) {}

    std::size_t size() const { return len; }
    bool empty() const { return len == 0; }
    const std::uint8_t* data() const { return ptr; }
    std::uint8_t operator[](std::size_t i) const { return ptr[i]; }

    ByteView subspan(std::size_t n) const {
        if (n > len) return {};
        return ByteView(ptr + n, len - n);
    }
};

// Error payload: which field failed and why.
struct DecodeError {
    std::string where;
    std::string what;

    std::string describe() const { return where + ": " + what; }
};

using Bytes = std::vector<std::uint8_t>;

// ============================================================================
// Codecs (value <-> bytes)
// ============================================================================
namespace detail {

template<class U>
expected<U, DecodeError> readBigEndian(ByteView& s, const char* where) {
    constexpr std::size_t n = sizeof(U);
    if (s.size() < n) {
        return unexpected<DecodeError>({where, "need " + std::to_string(n) + " bytes"});
    }
    U v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        v = static_cast<U>((v << 8) | static_cast<U>(s[i]));
    }
    s = s.subspan(n);
    return v;
}

template<class U>
void writeBigEndian(U v, Bytes& out) {
    for (std::size_t i = sizeof(U); i-- > 0;) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
    }
}

} // namespace detail

struct BeU8 {
    expected<std::uint8_t, DecodeError> read(ByteView& s, const char* where) const {
        return detail::readBigEndian<std::uint8_t>(s, where);
    }
    void write(std::uint8_t v, Bytes& out) const { out.push_back(v); }
};

struct BeU16 {
    expected<std::uint16_t, DecodeError> read(ByteView& s, const char* where) const {
        return detail::readBigEndian<std::uint16_t>(s, where);
    }
    void write(std::uint16_t v, Bytes& out) const { detail::writeBigEndian(v, out); }
};

struct BeU32 {
    expected<std::uint32_t, DecodeError> read(ByteView& s, const char* where) const {
        return detail::readBigEndian<std::uint32_t>(s, where);
    }
    void write(std::uint32_t v, Bytes& out) const { detail::writeBigEndian(v, out); }
};

// Boolean carried as one byte; anything other than 0/1 is rejected.
struct BoolU8 {
    expected<bool, DecodeError> read(ByteView& s, const char* where) const {
        auto raw = detail::readBigEndian<std::uint8_t>(s, where);
        if (!raw) return unexpected<DecodeError>(raw.error());
        if (*raw > 1) return unexpected<DecodeError>({where, "boolean must be 0 or 1"});
        return *raw == 1;
    }
    void write(bool v, Bytes& out) const { out.push_back(v ? 1 : 0); }
};

// Fixed-length raw bytes (MAC addresses). Maps to std::array<uint8_t, N>.
template<std::size_t N>
struct FixedBytes {
    using Arr = std::array<std::uint8_t, N>;

    expected<Arr, DecodeError> read(ByteView& s, const char* where) const {
        if (s.size() < N) return unexpected<DecodeError>({where, "not enough bytes"});
        Arr out{};
        for (std::size_t i = 0; i < N; ++i) out[i] = s[i];
        s = s.subspan(N);
        return out;
    }
    void write(const Arr& a, Bytes& out) const { out.insert(out.end(), a.begin(), a.end()); }
};

// String prefixed by a one-byte length. Control characters are rejected.
struct PrefixedString {
    expected<std::string, DecodeError> read(ByteView& s, const char* where) const {
        if (s.size() < 1) return unexpected<DecodeError>({where, "missing length"});
        const std::size_t n = s[0];
        if (s.size() < 1 + n) {
            return unexpected<DecodeError>({where, "length " + std::to_string(n) + " exceeds packet"});
        }
        std::string out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            const auto c = s[1 + i];
            if (c < 0x20 || c == 0x7F) return unexpected<DecodeError>({where, "control character"});
            out.push_back(static_cast<char>(c));
        }
        s = s.subspan(1 + n);
        return out;
    }
    // Longer strings are truncated to 255 bytes.
    void write(const std::string& v, Bytes& out) const {
        const std::size_t n = v.size() > 255 ? 255 : v.size();
        out.push_back(static_cast<std::uint8_t>(n));
        out.insert(out.end(), v.begin(), v.begin() + static_cast<std::ptrdiff_t>(n));
    }
};

// ============================================================================
// Validators
// ============================================================================
template<std::uint32_t Min, std::uint32_t Max>
struct InRange {
    template<class U>
    expected<void, DecodeError> operator()(const char* where, const U& v) const {
        static_assert(std::is_integral<U>::value, "InRange applies to integral fields");
        const auto value = static_cast<std::uint64_t>(v);
        if (value < Min || value > Max) {
            std::ostringstream msg;
            msg << "value " << value << " outside " << Min << "-" << Max;
            return unexpected<DecodeError>({where, msg.str()});
        }
        return {};
    }
};

template<std::uint32_t Expected>
struct Equals {
    template<class U>
    expected<void, DecodeError> operator()(const char* where, const U& v) const {
        if (static_cast<std::uint64_t>(v) != Expected) {
            std::ostringstream msg;
            msg << "expected 0x" << std::hex << Expected << " got 0x" << static_cast<std::uint64_t>(v);
            return unexpected<DecodeError>({where, msg.str()});
        }
        return {};
    }
};

struct NotEmpty {
    expected<void, DecodeError> operator()(const char* where, const std::string& v) const {
        if (v.empty()) return unexpected<DecodeError>({where, "must not be empty"});
        return {};
    }
};

// ============================================================================
// Field descriptor
// ============================================================================
template<auto MemberPtr, class Codec, class... Validators>
struct Field {
    static constexpr auto memberPtr = MemberPtr;
    const char* name;
    Codec codec;
    std::tuple<Validators...> validators;
};

template<auto MemberPtr, class Codec, class... Validators>
Field<MemberPtr, Codec, Validators...>
field(const char* name, Codec c, Validators... vs) {
    return { name, c, std::tuple<Validators...>{vs...} };
}

// ============================================================================
// Object-level validator + schema
// ============================================================================
template<class Fn>
struct ObjectValidator { Fn fn; };

struct AcceptAll {
    template<class T>
    expected<void, DecodeError> operator()(const T&) const { return {}; }
};

template<class T, class FieldsTuple, class ObjValidator>
struct Schema {
    FieldsTuple fields;
    ObjValidator objValidator;
};

template<class T, class... FieldDescs>
Schema<T, std::tuple<FieldDescs...>, ObjectValidator<AcceptAll>>
makeSchema(std::tuple<FieldDescs...> fds) {
    return { std::move(fds), ObjectValidator<AcceptAll>{AcceptAll{}} };
}

namespace detail {

template<class FieldDesc, class V>
expected<void, DecodeError> runFieldValidators(const FieldDesc& fd, const V& v) {
    expected<void, DecodeError> ok{};
    std::apply([&](auto const&... val) {
        ( ( [&]() {
            if (!ok) return;
            auto r = val(fd.name, v);
            if (!r) ok = unexpected<DecodeError>(r.error());
        }() ), ... );
    }, fd.validators);
    return ok;
}

template<class V>
decltype(auto) wireValue(const V& v) {
    if constexpr (std::is_enum<V>::value) {
        return static_cast<std::underlying_type_t<V>>(v);
    } else {
        return (v);
    }
}

} // namespace detail

// ============================================================================
// decode / encode
// ============================================================================

// Decode one object from the front of `cursor`, advancing it past the object.
template<class T, class FieldsTuple, class ObjValidatorT>
expected<T, DecodeError>
decodeFrom(const Schema<T, FieldsTuple, ObjValidatorT>& sch, ByteView& cursor) {
    T obj{};
    ByteView s = cursor;

    bool failed = false;
    DecodeError err;

    std::apply([&](auto const&... fd) {
        ( ( [&]() {
            if (failed) return;

            using MemberT = std::remove_reference_t<decltype(obj.*(fd.memberPtr))>;

            auto raw = fd.codec.read(s, fd.name);
            if (!raw) { failed = true; err = raw.error(); return; }

            if (auto ok = detail::runFieldValidators(fd, *raw); !ok) {
                failed = true; err = ok.error(); return;
            }

            if constexpr (std::is_enum<MemberT>::value) {
                obj.*(fd.memberPtr) = static_cast<MemberT>(*raw);
            } else {
                obj.*(fd.memberPtr) = std::move(*raw);
            }
        }() ), ... );
    }, sch.fields);

    if (failed) return unexpected<DecodeError>(err);

    if (auto ok = sch.objValidator.fn(obj); !ok)
        return unexpected<DecodeError>(ok.error());

    cursor = s;
    return obj;
}

// Decode a whole buffer; leftover bytes are an error.
template<class T, class FieldsTuple, class ObjValidatorT>
expected<T, DecodeError>
decode(const Schema<T, FieldsTuple, ObjValidatorT>& sch, ByteView bytes) {
    auto obj = decodeFrom(sch, bytes);
    if (obj && !bytes.empty()) {
        return unexpected<DecodeError>({"packet", std::to_string(bytes.size()) + " trailing bytes"});
    }
    return obj;
}

// Append the encoding of `obj` to `out`. Field validators run before writing.
template<class T, class FieldsTuple, class ObjValidatorT>
expected<void, DecodeError>
encodeInto(const Schema<T, FieldsTuple, ObjValidatorT>& sch, const T& obj, Bytes& out) {
    if (auto ok = sch.objValidator.fn(obj); !ok)
        return unexpected<DecodeError>(ok.error());

    bool failed = false;
    DecodeError err;
    Bytes staged;

    std::apply([&](auto const&... fd) {
        ( ( [&]() {
            if (failed) return;
            const auto& v = detail::wireValue(obj.*(fd.memberPtr));
            if (auto ok = detail::runFieldValidators(fd, v); !ok) {
                failed = true; err = ok.error(); return;
            }
            fd.codec.write(v, staged);
        }() ), ... );
    }, sch.fields);

    if (failed) return unexpected<DecodeError>(err);
    out.insert(out.end(), staged.begin(), staged.end());
    return {};
}

template<class T, class FieldsTuple, class ObjValidatorT>
expected<Bytes, DecodeError>
encode(const Schema<T, FieldsTuple, ObjValidatorT>& sch, const T& obj) {
    Bytes out;
    if (auto ok = encodeInto(sch, obj, out); !ok)
        return unexpected<DecodeError>(ok.error());
    return out;
}

} // namespace pixelair::schema
