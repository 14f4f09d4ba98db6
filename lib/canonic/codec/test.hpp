/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_TEST_HPP
#define CANONIC_CODEC_TEST_HPP

#include <map>
#include <set>
#include <canonic/common/test.hpp>
#include <canonic/codec/codec.hpp>

namespace canonic::codec {
    template<typename F>
    void expect_error_kind(const error_kind kind, F &&action, const std::source_location &loc=std::source_location::current())
    {
        try {
            action();
            expect(false, loc) << fmt::format("expected {} but no exception has been thrown", kind);
        } catch (const error &ex) {
            expect(ex.kind() == kind, loc) << fmt::format("expected {} but got: {}", kind, ex.what());
        }
    }

    // types shared by the codec tests
    namespace test_types {
        struct point {
            uint32_t x = 0;
            uint64_t y = 0;

            static void serialize(auto &archive, auto &self)
            {
                archive(self.x, self.y);
            }

            bool operator==(const point &) const =default;
        };

        struct unit_struct {
            static void serialize(auto &, auto &)
            {
            }

            bool operator==(const unit_struct &) const =default;
        };

        struct tuple_struct {
            uint32_t field0 = 0;
            uint64_t field1 = 0;

            static void serialize(auto &archive, auto &self)
            {
                archive(self.field0, self.field1);
            }

            bool operator==(const tuple_struct &) const =default;
        };

        struct simple_list {
            std::optional<std::unique_ptr<simple_list>> next {};

            static void serialize(auto &archive, auto &self)
            {
                archive(self.next);
            }

            static simple_list with_depth(const size_t depth)
            {
                simple_list head {};
                for (size_t i = 1; i < depth; ++i) {
                    simple_list outer {};
                    outer.next.emplace(std::make_unique<simple_list>(std::move(head)));
                    head = std::move(outer);
                }
                return head;
            }

            size_t depth() const
            {
                size_t d = 1;
                for (const auto *p = this; p->next; p = p->next->get())
                    ++d;
                return d;
            }

            bool operator==(const simple_list &o) const
            {
                return depth() == o.depth();
            }
        };

        struct primitive_types {
            bool f_bool = false;
            uint8_t f_u8 = 0;
            uint16_t f_u16 = 0;
            uint32_t f_u32 = 0;
            uint64_t f_u64 = 0;
            uint128_t f_u128 {};
            int8_t f_i8 = 0;
            int16_t f_i16 = 0;
            int32_t f_i32 = 0;
            int64_t f_i64 = 0;
            int128_t f_i128 {};
            float f_f32 = 0;
            double f_f64 = 0;
            char32_t f_char = 0;

            static void serialize(auto &archive, auto &self)
            {
                archive(self.f_bool, self.f_u8, self.f_u16, self.f_u32, self.f_u64, self.f_u128,
                    self.f_i8, self.f_i16, self.f_i32, self.f_i64, self.f_i128, self.f_f32, self.f_f64, self.f_char);
            }

            bool operator==(const primitive_types &) const =default;
        };

        struct other_types {
            std::string f_string {};
            uint8_vector f_bytes {};
            std::optional<point> f_option {};
            std::monostate f_unit {};
            std::vector<point> f_seq {};
            std::pair<uint8_t, uint16_t> f_tuple {};
            std::map<std::string, uint32_t> f_stringmap {};
            std::set<uint64_t> f_intset {};
            std::vector<std::vector<point>> f_nested_seq {};

            static void serialize(auto &archive, auto &self)
            {
                archive(self.f_string, self.f_bytes, self.f_option, self.f_unit, self.f_seq, self.f_tuple,
                    self.f_stringmap, self.f_intset, self.f_nested_seq);
            }

            bool operator==(const other_types &) const =default;
        };

        // unit, tuple, and struct variants
        using choice = std::variant<std::monostate, std::pair<uint16_t, bool>, point>;
    }
}

#endif // !CANONIC_CODEC_TEST_HPP
