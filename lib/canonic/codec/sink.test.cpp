/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canonic/codec/test.hpp>

using namespace canonic;
using namespace canonic::codec;

suite codec_sink_suite = [] {
    "codec::sink"_test = [] {
        "vector_sink"_test = [] {
            vector_sink out {};
            out.write(uint8_t { 0x01 });
            out.write(uint8_vector::from_hex("0203"));
            test_same(out.size(), 3ULL);
            test_same(out.bytes(), uint8_vector::from_hex("010203"));
        };
        "capped vector_sink"_test = [] {
            vector_sink out { 4 };
            serialize(out, uint32_t { 0xDEADBEEF });
            test_same(out.bytes(), uint8_vector::from_hex("EFBEADDE"));
            expect_error_kind(error_kind::sink_exhausted, [&] { out.write(uint8_t { 0 }); });
            vector_sink small { 7 };
            expect_error_kind(error_kind::sink_exhausted, [&] { serialize(small, uint64_t { 1 }); });
        };
        "span_sink"_test = [] {
            std::array<uint8_t, 6> mem {};
            span_sink out { mem };
            serialize(out, std::string { "abc" });
            test_same(out.size(), 4ULL);
            test_same(uint8_vector { out.bytes() }, uint8_vector::from_hex("03616263"));
            expect_error_kind(error_kind::sink_exhausted, [&] { serialize(out, uint32_t { 7 }); });
            serialize(out, uint16_t { 0x0102 });
            test_same(uint8_vector { out.bytes() }, uint8_vector::from_hex("036162630201"));
        };
    };
    "codec::source"_test = [] {
        "read"_test = [] {
            const auto data = uint8_vector::from_hex("0102030405");
            source in { data };
            test_same(in.read_byte(), uint8_t { 1 });
            test_same(uint8_vector { in.read(2) }, uint8_vector::from_hex("0203"));
            test_same(in.pos(), 3ULL);
            test_same(in.remaining(), 2ULL);
            test_same(uint8_vector { in.consumed_since(1) }, uint8_vector::from_hex("0203"));
            expect_error_kind(error_kind::trailing_data, [&] { in.ensure_empty(); });
            expect_error_kind(error_kind::unexpected_end_of_input, [&] { in.read(3); });
            // a failed read does not move the cursor
            test_same(in.pos(), 3ULL);
            in.read(2);
            expect(in.empty());
            expect(nothrow([&] { in.ensure_empty(); }));
            expect_error_kind(error_kind::unexpected_end_of_input, [&] { in.read_byte(); });
        };
    };
};
