/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <unordered_map>
#include <unordered_set>
#include <canonic/codec/test.hpp>

using namespace canonic;
using namespace canonic::codec;
using namespace canonic::codec::test_types;

namespace {
    primitive_types sample_primitives()
    {
        primitive_types v {};
        v.f_bool = true;
        v.f_u8 = 255;
        v.f_u16 = 300;
        v.f_u32 = 3000000;
        v.f_u64 = std::numeric_limits<uint64_t>::max();
        v.f_u128 = std::numeric_limits<uint128_t>::max();
        v.f_i8 = -128;
        v.f_i16 = -400;
        v.f_i32 = -30000000;
        v.f_i64 = std::numeric_limits<int64_t>::max();
        v.f_i128 = primitive::int128_max();
        v.f_f32 = 623929.125F;
        v.f_f64 = 9223372036854775807.21;
        v.f_char = 20;
        return v;
    }

    other_types sample_others()
    {
        other_types v {};
        v.f_string = "this is a string";
        v.f_bytes = uint8_vector::from_hex("010203");
        v.f_seq = { point { 5, 100 }, point { 5, 100 } };
        v.f_tuple = { 100, 300 };
        v.f_stringmap = { { "key", 2000 } };
        v.f_intset = { 500 };
        v.f_nested_seq = { { point { 1, 3 } } };
        return v;
    }
}

suite codec_codec_suite = [] {
    "codec::codec"_test = [] {
        "struct"_test = [] {
            const point v { 100, 200000 };
            const auto bytes = serialize(v);
            test_same(bytes, uint8_vector::from_hex("64000000400D030000000000"));
            expect(deserialize<point>(bytes) == v);
        };
        "unit struct"_test = [] {
            const auto bytes = serialize(unit_struct {});
            expect(bytes.empty());
            expect(deserialize<unit_struct>(bytes) == unit_struct {});
            expect_error_kind(error_kind::trailing_data, [] { deserialize<unit_struct>(uint8_vector::from_hex("00")); });
        };
        "tuple struct"_test = [] {
            const tuple_struct v { 10, 20 };
            const auto bytes = serialize(v);
            test_same(bytes, uint8_vector::from_hex("0A0000001400000000000000"));
            expect(deserialize<tuple_struct>(bytes) == v);
        };
        "simple list"_test = [] {
            const auto v = simple_list::with_depth(2);
            const auto bytes = serialize(v);
            test_same(bytes, uint8_vector::from_hex("0100"));
            const auto copy = deserialize<simple_list>(bytes);
            test_same(copy.depth(), 2ULL);
        };
        "primitive types"_test = [] {
            const auto v = sample_primitives();
            const auto bytes = serialize(v);
            test_same(bytes.size(), 1ULL + 1 + 2 + 4 + 8 + 16 + 1 + 2 + 4 + 8 + 16 + 4 + 8 + 4);
            expect(deserialize<primitive_types>(bytes) == v);
        };
        "other types"_test = [] {
            const auto v = sample_others();
            const auto bytes = serialize(v);
            const auto exp = uint8_vector::from_hex(
                "10" "74686973206973206120737472696E67" // string
                "03" "010203" // bytes
                "00" // option
                // unit takes no space
                "02" "050000006400000000000000" "050000006400000000000000" // sequence of structs
                "64" "2C01" // tuple
                "01" "03" "6B6579" "D0070000" // string map
                "01" "F401000000000000" // int set
                "01" "01" "010000000300000000000000" // nested sequence
            );
            test_same(bytes, exp);
            expect(deserialize<other_types>(bytes) == v);
        };
        "enum"_test = [] {
            test_same(serialize(choice { std::monostate {} }), uint8_vector::from_hex("00"));
            test_same(serialize(choice { std::pair<uint16_t, bool> { 7, true } }), uint8_vector::from_hex("01070001"));
            test_same(serialize(choice { point { 1, 2 } }), uint8_vector::from_hex("02010000000200000000000000"));
            for (const auto &v: { choice { std::monostate {} }, choice { std::pair<uint16_t, bool> { 7, true } }, choice { point { 1, 2 } } })
                expect(deserialize<choice>(serialize(v)) == v);
            expect_error_kind(error_kind::unknown_variant_tag, [] { deserialize<choice>(uint8_vector::from_hex("03")); });
            expect_error_kind(error_kind::unknown_variant_tag, [] { deserialize<choice>(uint8_vector::from_hex("8001")); });
            expect_error_kind(error_kind::non_canonical_length, [] { deserialize<choice>(uint8_vector::from_hex("8000")); });
        };
        "string"_test = [] {
            test_same(serialize(std::string {}), uint8_vector::from_hex("00"));
            test_same(serialize(std::string { "ü" }), uint8_vector::from_hex("02C3BC"));
            test_same(deserialize<std::string>(uint8_vector::from_hex("0461626364")), std::string { "abcd" });
            expect_error_kind(error_kind::unexpected_end_of_input, [] { deserialize<std::string>(uint8_vector::from_hex("05616263")); });
        };
        "invalid utf8"_test = [] {
            // a truncated multi-byte sequence, an overlong encoding, a surrogate, and a code point above U+10FFFF
            for (const auto *hex: { "01C3", "02C0AF", "03EDA080", "04F4908080" })
                expect_error_kind(error_kind::invalid_utf8, [&] { deserialize<std::string>(uint8_vector::from_hex(hex)); });
            expect_error_kind(error_kind::invalid_utf8, [] { serialize(std::string { "\xC3" }); });
        };
        "bytes"_test = [] {
            test_same(serialize(uint8_vector {}), uint8_vector::from_hex("00"));
            test_same(serialize(uint8_vector::from_hex("FF00")), uint8_vector::from_hex("02FF00"));
            test_same(deserialize<uint8_vector>(uint8_vector::from_hex("03C3FFFE")), uint8_vector::from_hex("C3FFFE"));
        };
        "option"_test = [] {
            test_same(serialize(std::optional<uint16_t> {}), uint8_vector::from_hex("00"));
            test_same(serialize(std::optional<uint16_t> { 5 }), uint8_vector::from_hex("010500"));
            expect(deserialize<std::optional<uint16_t>>(uint8_vector::from_hex("010500")) == std::optional<uint16_t> { 5 });
            expect(!deserialize<std::optional<uint16_t>>(uint8_vector::from_hex("00")));
            expect_error_kind(error_kind::unexpected_end_of_input, [] { deserialize<std::optional<uint16_t>>(uint8_vector::from_hex("01")); });
            expect_error_kind(error_kind::invalid_option_tag, [] { deserialize<std::optional<uint16_t>>(uint8_vector::from_hex("020500")); });
        };
        "tuple array"_test = [] {
            const std::array<uint16_t, 3> v { 1, 2, 3 };
            test_same(serialize(v), uint8_vector::from_hex("010002000300"));
            expect(deserialize<std::array<uint16_t, 3>>(serialize(v)) == v);
            expect_error_kind(error_kind::unexpected_end_of_input, [] { deserialize<std::array<uint16_t, 3>>(uint8_vector::from_hex("01000200")); });
        };
        "sequences"_test = [] {
            const std::vector<std::vector<uint8_t>> v { {}, { 1 }, { 2, 3 } };
            test_same(serialize(v), uint8_vector::from_hex("03" "00" "0101" "020203"));
            expect(deserialize<std::vector<std::vector<uint8_t>>>(serialize(v)) == v);
            expect_error_kind(error_kind::unexpected_end_of_input, [] { deserialize<std::vector<uint32_t>>(uint8_vector::from_hex("FFFFFFFF07")); });
        };
        "unordered containers"_test = [] {
            const std::unordered_map<uint32_t, bool> m { { 2, true }, { 1, false } };
            const std::map<uint32_t, bool> sm { m.begin(), m.end() };
            test_same(serialize(m), serialize(sm));
            expect(deserialize<std::unordered_map<uint32_t, bool>>(serialize(m)) == m);
            const std::unordered_set<int16_t> s { -1, 1, 0 };
            test_same(serialize(s), uint8_vector::from_hex("03" "0000" "0100" "FFFF"));
            expect(deserialize<std::unordered_set<int16_t>>(serialize(s)) == s);
        };
        "boxes"_test = [] {
            const auto box = std::make_unique<point>(point { 1, 2 });
            test_same(serialize(box), serialize(*box));
            const auto copy = deserialize<std::shared_ptr<point>>(serialize(box));
            expect(*copy == *box);
            expect(throws<canonic::error>([] { serialize(std::unique_ptr<point> {}); }));
        };
        "decoded values own their data"_test = [] {
            auto bytes = uint8_vector::from_hex("03616263");
            const auto s = deserialize<std::string>(bytes);
            bytes[1] = 'x';
            test_same(s, std::string { "abc" });
        };
    };
};
