/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canonic/codec/test.hpp>

using namespace canonic;
using namespace canonic::codec;

suite codec_error_suite = [] {
    "codec::error"_test = [] {
        "message"_test = [] {
            const codec::error ex { error_kind::trailing_data, "{} unconsumed bytes at offset {}", 2, 10 };
            test_same(std::string_view { ex.what() }, std::string_view { "trailing data: 2 unconsumed bytes at offset 10" });
            expect(ex.kind() == error_kind::trailing_data);
        };
        "a codec error is a canonic error"_test = [] {
            expect(throws<canonic::error>([] { deserialize<bool>(uint8_vector::from_hex("05")); }));
        };
        "offsets"_test = [] {
            try {
                deserialize<std::pair<uint16_t, bool>>(uint8_vector::from_hex("010002"));
                expect(false);
            } catch (const codec::error &ex) {
                expect(ex.kind() == error_kind::invalid_boolean);
                expect(std::string_view { ex.what() }.find("at offset 2") != std::string_view::npos) << ex.what();
            }
        };
        "names"_test = [] {
            test_same(fmt::format("{}", error_kind::duplicate_key), std::string { "duplicate key" });
            test_same(fmt::format("{}", error_kind::recursion_limit_exceeded), std::string { "recursion limit exceeded" });
            test_same(fmt::format("{}", error_kind::map_not_canonically_ordered), std::string { "map not canonically ordered" });
        };
    };
};
