/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_ULEB128_HPP
#define CANONIC_CODEC_ULEB128_HPP

#include <array>
#include <canonic/codec/limits.hpp>
#include <canonic/codec/sink.hpp>
#include <canonic/codec/source.hpp>

/*
 * Unsigned LEB128 as used for collection lengths and variant tags:
 * 7 payload bits per byte, least-significant group first, the high bit marks all bytes but the last.
 * Values are limited to 32 bits and only the shortest encoding of a value is accepted.
 */

namespace canonic::codec::uleb128 {
    static constexpr size_t max_bytes = 5;

    inline void encode(sink &out, uint64_t val)
    {
        if (val > max_uleb128_value) [[unlikely]]
            throw error(error_kind::length_overflow, "value {} does not fit into 32 bits", val);
        std::array<uint8_t, max_bytes> bytes;
        size_t sz = 0;
        while (val >= 0x80) {
            bytes[sz++] = static_cast<uint8_t>(val & 0x7F) | 0x80;
            val >>= 7;
        }
        bytes[sz++] = static_cast<uint8_t>(val);
        out.write(buffer { bytes.data(), sz });
    }

    inline uint32_t decode(source &in)
    {
        const auto start = in.pos();
        uint64_t val = 0;
        for (size_t i = 0; i < max_bytes; ++i) {
            const auto b = in.read_byte();
            val |= static_cast<uint64_t>(b & 0x7F) << (i * 7);
            if (!(b & 0x80)) {
                if (b == 0 && i > 0) [[unlikely]]
                    throw error(error_kind::non_canonical_length, "a {}-byte encoding at offset {} has a redundant trailing zero byte", i + 1, start);
                if (val > max_uleb128_value) [[unlikely]]
                    throw error(error_kind::length_overflow, "value {} at offset {} does not fit into 32 bits", val, start);
                return static_cast<uint32_t>(val);
            }
        }
        throw error(error_kind::length_overflow, "the encoding at offset {} is longer than {} bytes", start, max_bytes);
    }

    inline size_t encoded_size(uint64_t val) noexcept
    {
        size_t sz = 1;
        while (val >= 0x80) {
            val >>= 7;
            ++sz;
        }
        return sz;
    }
}

#endif // !CANONIC_CODEC_ULEB128_HPP
