/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <set>
#include <canonic/codec/shape.hpp>

namespace canonic::codec {
    const char *primitive_kind_name(const primitive_kind kind)
    {
        switch (kind) {
            case primitive_kind::boolean: return "bool";
            case primitive_kind::u8: return "u8";
            case primitive_kind::u16: return "u16";
            case primitive_kind::u32: return "u32";
            case primitive_kind::u64: return "u64";
            case primitive_kind::u128: return "u128";
            case primitive_kind::i8: return "i8";
            case primitive_kind::i16: return "i16";
            case primitive_kind::i32: return "i32";
            case primitive_kind::i64: return "i64";
            case primitive_kind::i128: return "i128";
            case primitive_kind::f32: return "f32";
            case primitive_kind::f64: return "f64";
            case primitive_kind::character: return "char";
            default: throw canonic::error(fmt::format("unsupported primitive kind: {}", static_cast<int>(kind)));
        }
    }

    size_t primitive_kind_size(const primitive_kind kind)
    {
        switch (kind) {
            case primitive_kind::boolean:
            case primitive_kind::u8:
            case primitive_kind::i8:
                return 1;
            case primitive_kind::u16:
            case primitive_kind::i16:
                return 2;
            case primitive_kind::u32:
            case primitive_kind::i32:
            case primitive_kind::f32:
            case primitive_kind::character:
                return 4;
            case primitive_kind::u64:
            case primitive_kind::i64:
            case primitive_kind::f64:
                return 8;
            case primitive_kind::u128:
            case primitive_kind::i128:
                return 16;
            default: throw canonic::error(fmt::format("unsupported primitive kind: {}", static_cast<int>(kind)));
        }
    }

    const variant_shape *sum_shape::find(const uint32_t tag) const noexcept
    {
        for (const auto &v: variants) {
            if (v.tag == tag)
                return &v;
        }
        return nullptr;
    }

    static std::string fields_to_string(const shape_list &fields)
    {
        std::string res { "(" };
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0)
                res += ", ";
            res += fields[i]->to_string();
        }
        res += ')';
        return res;
    }

    std::string shape::to_string() const
    {
        return std::visit([](const auto &s) -> std::string {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, primitive_shape>) {
                return primitive_kind_name(s.kind);
            } else if constexpr (std::is_same_v<T, product_shape>) {
                return fields_to_string(s.fields);
            } else if constexpr (std::is_same_v<T, sum_shape>) {
                std::string res { "enum {" };
                for (size_t i = 0; i < s.variants.size(); ++i) {
                    const auto &v = s.variants[i];
                    res += fmt::format("{}{}={}{}", i > 0 ? ", " : " ", v.name, v.tag, fields_to_string(v.fields.fields));
                }
                res += " }";
                return res;
            } else if constexpr (std::is_same_v<T, string_shape>) {
                return "string";
            } else if constexpr (std::is_same_v<T, bytes_shape>) {
                return "bytes";
            } else if constexpr (std::is_same_v<T, sequence_shape>) {
                return fmt::format("seq<{}>", s.element->to_string());
            } else if constexpr (std::is_same_v<T, tuple_array_shape>) {
                return fmt::format("[{}; {}]", s.element->to_string(), s.size);
            } else if constexpr (std::is_same_v<T, option_shape>) {
                return fmt::format("option<{}>", s.element->to_string());
            } else if constexpr (std::is_same_v<T, map_shape>) {
                return fmt::format("map<{}, {}>", s.key->to_string(), s.val->to_string());
            } else if constexpr (std::is_same_v<T, set_shape>) {
                return fmt::format("set<{}>", s.key->to_string());
            } else if constexpr (std::is_same_v<T, named_shape>) {
                return s.name;
            } else {
                throw canonic::error(fmt::format("unsupported shape type: {}", typeid(T).name()));
            }
        }, def);
    }

    namespace shapes {
        static shape_ptr make(shape::storage &&def)
        {
            return std::make_shared<const shape>(shape { std::move(def) });
        }

        static shape_ptr non_null(shape_ptr s, const std::string_view role)
        {
            if (!s) [[unlikely]]
                throw canonic::error(fmt::format("the {} shape must not be null!", role));
            return s;
        }

        shape_ptr primitive(const primitive_kind kind)
        {
            return make(primitive_shape { kind });
        }

        shape_ptr product(shape_list fields)
        {
            for (const auto &f: fields)
                non_null(f, "field");
            return make(product_shape { std::move(fields) });
        }

        shape_ptr unit()
        {
            return product();
        }

        shape_ptr sum(std::vector<variant_shape> variants)
        {
            std::set<uint32_t> tags {};
            for (const auto &v: variants) {
                if (!tags.emplace(v.tag).second) [[unlikely]]
                    throw canonic::error(fmt::format("variant {} reuses tag {}", v.name, v.tag));
                for (const auto &f: v.fields.fields)
                    non_null(f, "variant field");
            }
            return make(sum_shape { std::move(variants) });
        }

        shape_ptr string()
        {
            return make(string_shape {});
        }

        shape_ptr bytes()
        {
            return make(bytes_shape {});
        }

        shape_ptr sequence(shape_ptr element)
        {
            return make(sequence_shape { non_null(std::move(element), "element") });
        }

        shape_ptr tuple_array(shape_ptr element, const size_t size)
        {
            return make(tuple_array_shape { non_null(std::move(element), "element"), size });
        }

        shape_ptr option(shape_ptr element)
        {
            return make(option_shape { non_null(std::move(element), "element") });
        }

        shape_ptr map(shape_ptr key, shape_ptr val)
        {
            return make(map_shape { non_null(std::move(key), "key"), non_null(std::move(val), "value") });
        }

        shape_ptr set(shape_ptr key)
        {
            return make(set_shape { non_null(std::move(key), "key") });
        }

        shape_ptr named(std::string name)
        {
            return make(named_shape { std::move(name) });
        }
    }

    void shape_registry::add(const std::string &name, shape_ptr s)
    {
        if (!s) [[unlikely]]
            throw canonic::error(fmt::format("cannot register a null shape under the name {}", name));
        if (const auto [it, created] = _shapes.try_emplace(name, std::move(s)); !created) [[unlikely]]
            throw canonic::error(fmt::format("a shape named {} is already registered", name));
    }

    const shape &shape_registry::at(const std::string_view name) const
    {
        if (const auto it = _shapes.find(name); it != _shapes.end()) [[likely]]
            return *it->second;
        throw canonic::error(fmt::format("unknown shape name: {}", name));
    }

    const shape &shape_registry::resolve(const shape &s) const
    {
        const shape *cur = &s;
        // a chain of aliases longer than the registry means a cycle of references
        for (size_t steps = 0; std::holds_alternative<named_shape>(cur->def); ++steps) {
            if (steps > _shapes.size()) [[unlikely]]
                throw canonic::error(fmt::format("shape {} is an alias cycle", s.to_string()));
            cur = &at(std::get<named_shape>(cur->def).name);
        }
        return *cur;
    }
}
