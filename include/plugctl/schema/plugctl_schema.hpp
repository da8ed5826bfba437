#pragma once
// plugctl_schema.hpp (C++17, header-only)
// -----------------------------------------------------------------------------
// Declarative big-endian field layouts with per-field and whole-object
// validation. Used for the fixed-size parts of device frames.
//
//   struct Hdr { std::uint32_t magic; std::uint32_t len; };
//   using namespace plugctl::schema;
//   constexpr auto fields = std::make_tuple(
//       field<&Hdr::magic>("magic", BeU32{}, Equals<0x55AAu>{}),
//       field<&Hdr::len  >("len"  , BeU32{}, AtMost<4096u>{}));
//   const auto schema = makeSchema<Hdr>(fields);
//   auto hdr  = decode(schema, ByteView(bytes));
//   auto blob = encode(schema, hdr.value());
// -----------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

namespace plugctl::schema {

template<class T, class E>
using expected = tl::expected<T, E>;
template<class E>
using unexpected = tl::unexpected<E>;

/// Read-only byte slice that shrinks as fields are consumed.
struct ByteView {
    const std::uint8_t* ptr = nullptr;
    std::size_t len = 0;

    ByteView() = default;
    ByteView(const std::uint8_t* p, std::size_t n) : ptr(p), len(n) {}

    template<class Container>
    explicit ByteView(const Container& c)
    : ptr(reinterpret_cast<const std::uint8_t*>(c.data())), len(c.size()) {}

    std::size_t size() const { return len; }
    const std::uint8_t* data() const { return ptr; }
    std::uint8_t operator[](std::size_t i) const { return ptr[i]; }

    ByteView subspan(std::size_t n) const {
        if (n > len) return {};
        return ByteView(ptr + n, len - n);
    }
};

struct DecodeError {
    std::string where;
    std::string what;
};

// ============================================================================
// Codecs
// ============================================================================
struct BeU32 {
    expected<std::uint32_t, DecodeError>
    read(ByteView& s, const char* where) const {
        if (s.size() < 4) return unexpected<DecodeError>({where, "need 4 bytes"});
        const std::uint32_t v = (static_cast<std::uint32_t>(s[0]) << 24)
                              | (static_cast<std::uint32_t>(s[1]) << 16)
                              | (static_cast<std::uint32_t>(s[2]) << 8)
                              |  static_cast<std::uint32_t>(s[3]);
        s = s.subspan(4);
        return v;
    }

    void write(std::uint32_t v, std::vector<std::uint8_t>& out) const {
        out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
        out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
        out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
        out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    }
};

// ============================================================================
// Field validators
// ============================================================================
template<std::uint32_t Expected>
struct Equals {
    expected<void, DecodeError> operator()(const char* where, std::uint32_t v) const {
        if (v != Expected) {
            std::ostringstream msg;
            msg << "expected 0x" << std::hex << Expected << " got 0x" << v;
            return unexpected<DecodeError>({where, msg.str()});
        }
        return {};
    }
};

template<std::uint32_t Limit>
struct AtMost {
    expected<void, DecodeError> operator()(const char* where, std::uint32_t v) const {
        if (v > Limit) {
            std::ostringstream msg;
            msg << v << " exceeds " << Limit;
            return unexpected<DecodeError>({where, msg.str()});
        }
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
constexpr Field<MemberPtr, Codec, Validators...>
field(const char* name, Codec c, Validators... vs) {
    return { name, c, std::tuple<Validators...>{vs...} };
}

// ============================================================================
// Schema
// ============================================================================
template<class Fn>
struct ObjectValidator { Fn fn; };

template<class Fn>
ObjectValidator<Fn> objectValidator(Fn fn) { return ObjectValidator<Fn>{fn}; }

struct AcceptAll {
    template<class T>
    expected<void, DecodeError> operator()(const T&) const { return {}; }
};

template<class T, class FieldsTuple, class ObjRule>
struct Schema {
    FieldsTuple fields;
    ObjRule objectRule;
};

template<class T, class... FieldDescs>
Schema<T, std::tuple<FieldDescs...>, AcceptAll>
makeSchema(std::tuple<FieldDescs...> fds) {
    return { std::move(fds), AcceptAll{} };
}

template<class T, class... FieldDescs, class Fn>
Schema<T, std::tuple<FieldDescs...>, Fn>
makeSchema(std::tuple<FieldDescs...> fds, ObjectValidator<Fn> ov) {
    return { std::move(fds), std::move(ov.fn) };
}

namespace detail {

template<class FieldDesc, class V>
expected<void, DecodeError> checkField(const FieldDesc& fd, const V& v) {
    expected<void, DecodeError> result{};
    std::apply([&](auto const&... rule) {
        ( [&] {
            if (!result) return;
            if (auto r = rule(fd.name, v); !r) result = unexpected<DecodeError>(r.error());
        }(), ... );
    }, fd.validators);
    return result;
}

} // namespace detail

template<class T, class FieldsTuple, class ObjRule>
expected<T, DecodeError>
decode(const Schema<T, FieldsTuple, ObjRule>& sch, ByteView bytes) {
    T obj{};
    ByteView s = bytes;
    expected<void, DecodeError> status{};

    std::apply([&](auto const&... fd) {
        ( [&] {
            if (!status) return;
            auto raw = fd.codec.read(s, fd.name);
            if (!raw) { status = unexpected<DecodeError>(raw.error()); return; }
            if (auto ok = detail::checkField(fd, *raw); !ok) { status = ok; return; }
            obj.*(fd.memberPtr) = *raw;
        }(), ... );
    }, sch.fields);

    if (!status) return unexpected<DecodeError>(status.error());
    if (auto ok = sch.objectRule(obj); !ok) return unexpected<DecodeError>(ok.error());
    return obj;
}

template<class T, class FieldsTuple, class ObjRule>
expected<std::vector<std::uint8_t>, DecodeError>
encode(const Schema<T, FieldsTuple, ObjRule>& sch, const T& obj) {
    if (auto ok = sch.objectRule(obj); !ok) return unexpected<DecodeError>(ok.error());

    std::vector<std::uint8_t> out;
    expected<void, DecodeError> status{};

    std::apply([&](auto const&... fd) {
        ( [&] {
            if (!status) return;
            const auto& v = obj.*(fd.memberPtr);
            if (auto ok = detail::checkField(fd, v); !ok) { status = ok; return; }
            fd.codec.write(v, out);
        }(), ... );
    }, sch.fields);

    if (!status) return unexpected<DecodeError>(status.error());
    return out;
}

} // namespace plugctl::schema
