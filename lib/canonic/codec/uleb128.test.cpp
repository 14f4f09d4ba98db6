/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canonic/codec/test.hpp>

using namespace canonic;
using namespace canonic::codec;

namespace {
    uint8_vector encode_uleb(const uint64_t v)
    {
        vector_sink out {};
        uleb128::encode(out, v);
        return std::move(out.bytes());
    }

    uint32_t decode_uleb(const uint8_vector &data)
    {
        source in { data };
        const auto v = uleb128::decode(in);
        in.ensure_empty();
        return v;
    }
}

suite codec_uleb128_suite = [] {
    "codec::uleb128"_test = [] {
        "encode"_test = [] {
            test_same(encode_uleb(0), uint8_vector::from_hex("00"));
            test_same(encode_uleb(1), uint8_vector::from_hex("01"));
            test_same(encode_uleb(127), uint8_vector::from_hex("7F"));
            test_same(encode_uleb(128), uint8_vector::from_hex("8001"));
            test_same(encode_uleb(300), uint8_vector::from_hex("AC02"));
            test_same(encode_uleb(16384), uint8_vector::from_hex("808001"));
            test_same(encode_uleb(0xFFFFFFFFULL), uint8_vector::from_hex("FFFFFFFF0F"));
        };
        "decode"_test = [] {
            test_same(decode_uleb(uint8_vector::from_hex("00")), 0U);
            test_same(decode_uleb(uint8_vector::from_hex("7F")), 127U);
            test_same(decode_uleb(uint8_vector::from_hex("8001")), 128U);
            test_same(decode_uleb(uint8_vector::from_hex("AC02")), 300U);
            test_same(decode_uleb(uint8_vector::from_hex("FFFFFFFF0F")), 0xFFFFFFFFU);
        };
        "encoded_size"_test = [] {
            for (const uint64_t v: { 0ULL, 1ULL, 127ULL, 128ULL, 16383ULL, 16384ULL, 0x1FFFFFULL, 0x200000ULL, 0xFFFFFFFFULL })
                test_same(uleb128::encoded_size(v), encode_uleb(v).size());
        };
        "non-minimal encodings"_test = [] {
            expect_error_kind(error_kind::non_canonical_length, [] { decode_uleb(uint8_vector::from_hex("8000")); });
            expect_error_kind(error_kind::non_canonical_length, [] { decode_uleb(uint8_vector::from_hex("8100")); });
            expect_error_kind(error_kind::non_canonical_length, [] { decode_uleb(uint8_vector::from_hex("FF8000")); });
            expect_error_kind(error_kind::non_canonical_length, [] { decode_uleb(uint8_vector::from_hex("8080808000")); });
        };
        "overflow"_test = [] {
            expect_error_kind(error_kind::length_overflow, [] { encode_uleb(0x100000000ULL); });
            // 2^32 needs 33 bits
            expect_error_kind(error_kind::length_overflow, [] { decode_uleb(uint8_vector::from_hex("8080808010")); });
            expect_error_kind(error_kind::length_overflow, [] { decode_uleb(uint8_vector::from_hex("FFFFFFFF1F")); });
            expect_error_kind(error_kind::length_overflow, [] { decode_uleb(uint8_vector::from_hex("808080808001")); });
        };
        "truncated"_test = [] {
            expect_error_kind(error_kind::unexpected_end_of_input, [] { decode_uleb(uint8_vector {}); });
            expect_error_kind(error_kind::unexpected_end_of_input, [] { decode_uleb(uint8_vector::from_hex("80")); });
            expect_error_kind(error_kind::unexpected_end_of_input, [] { decode_uleb(uint8_vector::from_hex("FFFF")); });
        };
    };
};
