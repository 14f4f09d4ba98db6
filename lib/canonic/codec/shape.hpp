/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_SHAPE_HPP
#define CANONIC_CODEC_SHAPE_HPP

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <canonic/common/format.hpp>

/*
 * Runtime descriptions of the structure of encoded values.
 * Recursive shapes refer to themselves by name through a shape_registry,
 * so the shape graph itself is always acyclic.
 */

namespace canonic::codec {
    enum class primitive_kind: uint8_t {
        boolean, u8, u16, u32, u64, u128, i8, i16, i32, i64, i128, f32, f64, character
    };

    extern const char *primitive_kind_name(primitive_kind kind);
    extern size_t primitive_kind_size(primitive_kind kind);

    struct shape;
    using shape_ptr = std::shared_ptr<const shape>;
    using shape_list = std::vector<shape_ptr>;

    struct primitive_shape {
        primitive_kind kind;
    };

    // structs, tuples, and unit types
    struct product_shape {
        shape_list fields {};
    };

    struct variant_shape {
        uint32_t tag = 0;
        std::string name {};
        product_shape fields {};
    };

    struct sum_shape {
        std::vector<variant_shape> variants {};

        [[nodiscard]] const variant_shape *find(uint32_t tag) const noexcept;
    };

    struct string_shape {
    };

    struct bytes_shape {
    };

    struct sequence_shape {
        shape_ptr element;
    };

    // a fixed number of elements without a length prefix
    struct tuple_array_shape {
        shape_ptr element;
        size_t size = 0;
    };

    struct option_shape {
        shape_ptr element;
    };

    struct map_shape {
        shape_ptr key;
        shape_ptr val;
    };

    struct set_shape {
        shape_ptr key;
    };

    struct named_shape {
        std::string name;
    };

    struct shape {
        using storage = std::variant<primitive_shape, product_shape, sum_shape, string_shape, bytes_shape,
            sequence_shape, tuple_array_shape, option_shape, map_shape, set_shape, named_shape>;

        storage def;

        [[nodiscard]] std::string to_string() const;
    };

    namespace shapes {
        extern shape_ptr primitive(primitive_kind kind);
        extern shape_ptr product(shape_list fields={});
        extern shape_ptr unit();
        // throws if two variants share a tag
        extern shape_ptr sum(std::vector<variant_shape> variants);
        extern shape_ptr string();
        extern shape_ptr bytes();
        extern shape_ptr sequence(shape_ptr element);
        extern shape_ptr tuple_array(shape_ptr element, size_t size);
        extern shape_ptr option(shape_ptr element);
        extern shape_ptr map(shape_ptr key, shape_ptr val);
        extern shape_ptr set(shape_ptr key);
        extern shape_ptr named(std::string name);
    }

    struct shape_registry {
        void add(const std::string &name, shape_ptr s);
        [[nodiscard]] const shape &at(std::string_view name) const;
        // follows named references until a concrete shape is reached
        [[nodiscard]] const shape &resolve(const shape &s) const;
        [[nodiscard]] size_t size() const noexcept
        {
            return _shapes.size();
        }
    private:
        std::map<std::string, shape_ptr, std::less<>> _shapes {};
    };
}

namespace fmt {
    template<>
    struct formatter<canonic::codec::primitive_kind>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const canonic::codec::primitive_kind &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(canonic::codec::primitive_kind_name(v), ctx);
        }
    };

    template<>
    struct formatter<canonic::codec::shape>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !CANONIC_CODEC_SHAPE_HPP
