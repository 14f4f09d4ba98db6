/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_PRIMITIVE_HPP
#define CANONIC_CODEC_PRIMITIVE_HPP

#include <array>
#include <bit>
#include <concepts>
#include <canonic/big-int.hpp>
#include <canonic/codec/sink.hpp>
#include <canonic/codec/source.hpp>

/*
 * Fixed-width primitives. All multi-byte values are little-endian regardless of the host's byte order.
 */

namespace canonic::codec::primitive {
    static constexpr char32_t max_char = 0x10FFFF;

    template<std::unsigned_integral T>
    void encode_uint(sink &out, const T val)
    {
        std::array<uint8_t, sizeof(T)> bytes;
        for (size_t i = 0; i < sizeof(T); ++i)
            bytes[i] = static_cast<uint8_t>(val >> (i * 8));
        out.write(buffer { bytes.data(), bytes.size() });
    }

    template<std::unsigned_integral T>
    T decode_uint(source &in)
    {
        const auto bytes = in.read(sizeof(T));
        T val = 0;
        for (size_t i = 0; i < sizeof(T); ++i)
            val |= static_cast<T>(bytes[i]) << (i * 8);
        return val;
    }

    template<std::signed_integral T>
    void encode_int(sink &out, const T val)
    {
        encode_uint(out, static_cast<std::make_unsigned_t<T>>(val));
    }

    template<std::signed_integral T>
    T decode_int(source &in)
    {
        return static_cast<T>(decode_uint<std::make_unsigned_t<T>>(in));
    }

    inline void encode_bool(sink &out, const bool val)
    {
        out.write(static_cast<uint8_t>(val ? 1 : 0));
    }

    inline bool decode_bool(source &in)
    {
        const auto pos = in.pos();
        switch (const auto b = in.read_byte(); b) {
            case 0: return false;
            case 1: return true;
            default: throw error(error_kind::invalid_boolean, "byte 0x{:02X} at offset {}", b, pos);
        }
    }

    inline void encode_float(sink &out, const float val)
    {
        encode_uint(out, std::bit_cast<uint32_t>(val));
    }

    inline float decode_float(source &in)
    {
        return std::bit_cast<float>(decode_uint<uint32_t>(in));
    }

    inline void encode_double(sink &out, const double val)
    {
        encode_uint(out, std::bit_cast<uint64_t>(val));
    }

    inline double decode_double(source &in)
    {
        return std::bit_cast<double>(decode_uint<uint64_t>(in));
    }

    [[nodiscard]] inline bool valid_char(const uint32_t cp) noexcept
    {
        return cp <= max_char && (cp < 0xD800 || cp > 0xDFFF);
    }

    inline void encode_char(sink &out, const char32_t val)
    {
        if (!valid_char(val)) [[unlikely]]
            throw error(error_kind::value_out_of_range, "0x{:X} is not a unicode scalar value", static_cast<uint32_t>(val));
        encode_uint(out, static_cast<uint32_t>(val));
    }

    inline char32_t decode_char(source &in)
    {
        const auto pos = in.pos();
        const auto cp = decode_uint<uint32_t>(in);
        if (!valid_char(cp)) [[unlikely]]
            throw error(error_kind::invalid_char, "0x{:X} at offset {} is not a unicode scalar value", cp, pos);
        return static_cast<char32_t>(cp);
    }

    inline void encode_uint128(sink &out, const uint128_t &val)
    {
        encode_uint(out, static_cast<uint64_t>(val & std::numeric_limits<uint64_t>::max()));
        encode_uint(out, static_cast<uint64_t>(val >> 64));
    }

    inline uint128_t decode_uint128(source &in)
    {
        const uint128_t lo = decode_uint<uint64_t>(in);
        const uint128_t hi = decode_uint<uint64_t>(in);
        return (hi << 64) | lo;
    }

    inline const int128_t &int128_min()
    {
        static const int128_t v = -(int128_t { 1 } << 127);
        return v;
    }

    inline const int128_t &int128_max()
    {
        static const int128_t v = (int128_t { 1 } << 127) - 1;
        return v;
    }

    // int128_t is sign-magnitude, so the two's complement form is computed explicitly
    inline void encode_int128(sink &out, const int128_t &val)
    {
        if (val < int128_min() || val > int128_max()) [[unlikely]]
            throw error(error_kind::value_out_of_range, "{} does not fit into a 128-bit two's complement integer", val);
        if (val >= 0)
            return encode_uint128(out, static_cast<uint128_t>(val));
        const auto magnitude_minus_one = static_cast<uint128_t>(-(val + 1));
        encode_uint128(out, ~magnitude_minus_one);
    }

    inline int128_t decode_int128(source &in)
    {
        const auto u = decode_uint128(in);
        if (!bit_test(u, 127))
            return static_cast<int128_t>(u);
        const uint128_t magnitude_minus_one = ~u;
        return -static_cast<int128_t>(magnitude_minus_one) - 1;
    }
}

#endif // !CANONIC_CODEC_PRIMITIVE_HPP
