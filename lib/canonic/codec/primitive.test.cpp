/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <canonic/codec/test.hpp>

using namespace canonic;
using namespace canonic::codec;

suite codec_primitive_suite = [] {
    "codec::primitive"_test = [] {
        "bool"_test = [] {
            test_same(serialize(true), uint8_vector::from_hex("01"));
            test_same(serialize(false), uint8_vector::from_hex("00"));
            expect(deserialize<bool>(uint8_vector::from_hex("01")));
            expect(!deserialize<bool>(uint8_vector::from_hex("00")));
            expect_error_kind(error_kind::invalid_boolean, [] { deserialize<bool>(uint8_vector::from_hex("02")); });
            expect_error_kind(error_kind::invalid_boolean, [] { deserialize<bool>(uint8_vector::from_hex("FF")); });
        };
        "unsigned integers"_test = [] {
            test_same(serialize(uint8_t { 0xAB }), uint8_vector::from_hex("AB"));
            test_same(serialize(uint16_t { 300 }), uint8_vector::from_hex("2C01"));
            test_same(serialize(uint32_t { 3000000 }), uint8_vector::from_hex("C0C62D00"));
            test_same(serialize(uint64_t { 200000 }), uint8_vector::from_hex("400D030000000000"));
            test_same(deserialize<uint16_t>(uint8_vector::from_hex("2C01")), uint16_t { 300 });
            test_same(deserialize<uint32_t>(uint8_vector::from_hex("C0C62D00")), uint32_t { 3000000 });
        };
        "u64 max"_test = [] {
            const auto max = std::numeric_limits<uint64_t>::max();
            const auto bytes = serialize(max);
            test_same(bytes, uint8_vector::from_hex("FFFFFFFFFFFFFFFF"));
            test_same(deserialize<uint64_t>(bytes), max);
        };
        "signed integers"_test = [] {
            test_same(serialize(int8_t { -128 }), uint8_vector::from_hex("80"));
            test_same(serialize(int16_t { -400 }), uint8_vector::from_hex("70FE"));
            test_same(serialize(int32_t { -30000000 }), uint8_vector::from_hex("803C36FE"));
            test_same(serialize(int64_t { -1 }), uint8_vector::from_hex("FFFFFFFFFFFFFFFF"));
            test_same(serialize(std::numeric_limits<int64_t>::max()), uint8_vector::from_hex("FFFFFFFFFFFFFF7F"));
            test_same(deserialize<int16_t>(uint8_vector::from_hex("70FE")), int16_t { -400 });
            test_same(deserialize<int64_t>(uint8_vector::from_hex("0000000000000080")), std::numeric_limits<int64_t>::min());
        };
        "u128"_test = [] {
            const uint128_t max = std::numeric_limits<uint128_t>::max();
            test_same(serialize(max), uint8_vector::from_hex("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"));
            test_same(deserialize<uint128_t>(serialize(max)), max);
            const uint128_t v = (uint128_t { 1 } << 64) | 2;
            test_same(serialize(v), uint8_vector::from_hex("02000000000000000100000000000000"));
            test_same(deserialize<uint128_t>(serialize(v)), v);
        };
        "i128"_test = [] {
            test_same(serialize(primitive::int128_max()), uint8_vector::from_hex("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFF7F"));
            test_same(serialize(primitive::int128_min()), uint8_vector::from_hex("00000000000000000000000000000080"));
            test_same(serialize(int128_t { -1 }), uint8_vector::from_hex("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"));
            test_same(serialize(int128_t { -2 }), uint8_vector::from_hex("FEFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"));
            for (const auto &v: { primitive::int128_min(), primitive::int128_max(), int128_t { -1 }, int128_t { 0 }, int128_t { -12345678 } })
                test_same(deserialize<int128_t>(serialize(v)), v);
        };
        "i128 out of range"_test = [] {
            // the sign-magnitude representation can hold 2^127 and -2^127-1
            expect_error_kind(error_kind::value_out_of_range, [] { serialize(int128_t { primitive::int128_max() + 1 }); });
            expect_error_kind(error_kind::value_out_of_range, [] { serialize(int128_t { primitive::int128_min() - 1 }); });
        };
        "floats"_test = [] {
            test_same(serialize(623929.125F), uint8_vector::from_hex("92531849"));
            test_same(serialize(1.0), uint8_vector::from_hex("000000000000F03F"));
            test_same(deserialize<float>(serialize(623929.125F)), 623929.125F);
            test_same(deserialize<double>(serialize(9223372036854775807.21)), 9223372036854775807.21);
        };
        "nan payload"_test = [] {
            const auto nan_bits = uint8_vector::from_hex("0100F87F");
            const auto v = deserialize<float>(nan_bits);
            expect(std::isnan(v));
            test_same(serialize(v), nan_bits);
            const auto dnan_bits = uint8_vector::from_hex("01000000000CF8FF");
            test_same(serialize(deserialize<double>(dnan_bits)), dnan_bits);
        };
        "char"_test = [] {
            test_same(serialize(char32_t { 20 }), uint8_vector::from_hex("14000000"));
            test_same(serialize(char32_t { 0x10FFFF }), uint8_vector::from_hex("FFFF1000"));
            test_same(static_cast<uint32_t>(deserialize<char32_t>(uint8_vector::from_hex("41000000"))), 0x41U);
            expect_error_kind(error_kind::invalid_char, [] { deserialize<char32_t>(uint8_vector::from_hex("00001100")); });
            expect_error_kind(error_kind::invalid_char, [] { deserialize<char32_t>(uint8_vector::from_hex("00D80000")); });
            expect_error_kind(error_kind::invalid_char, [] { deserialize<char32_t>(uint8_vector::from_hex("FFDF0000")); });
            expect_error_kind(error_kind::value_out_of_range, [] { serialize(char32_t { 0xD800 }); });
        };
        "truncated"_test = [] {
            expect_error_kind(error_kind::unexpected_end_of_input, [] { deserialize<uint32_t>(uint8_vector::from_hex("010203")); });
            expect_error_kind(error_kind::unexpected_end_of_input, [] { deserialize<uint64_t>(uint8_vector {}); });
            expect_error_kind(error_kind::unexpected_end_of_input, [] { deserialize<bool>(uint8_vector {}); });
            expect_error_kind(error_kind::unexpected_end_of_input, [] { deserialize<uint128_t>(uint8_vector::from_hex("FFFFFFFFFFFFFFFF")); });
        };
    };
};
