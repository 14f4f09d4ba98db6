/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canonic/codec/shape-codec.hpp>

namespace canonic::codec {
    static void encode_primitive(encoder &enc, const primitive_kind kind, const value &v)
    {
        switch (kind) {
            case primitive_kind::boolean: enc.encode(v.as<bool>()); break;
            case primitive_kind::u8: enc.encode(v.as<uint8_t>()); break;
            case primitive_kind::u16: enc.encode(v.as<uint16_t>()); break;
            case primitive_kind::u32: enc.encode(v.as<uint32_t>()); break;
            case primitive_kind::u64: enc.encode(v.as<uint64_t>()); break;
            case primitive_kind::u128: enc.encode(v.as<uint128_t>()); break;
            case primitive_kind::i8: enc.encode(v.as<int8_t>()); break;
            case primitive_kind::i16: enc.encode(v.as<int16_t>()); break;
            case primitive_kind::i32: enc.encode(v.as<int32_t>()); break;
            case primitive_kind::i64: enc.encode(v.as<int64_t>()); break;
            case primitive_kind::i128: enc.encode(v.as<int128_t>()); break;
            case primitive_kind::f32: enc.encode(v.as<float>()); break;
            case primitive_kind::f64: enc.encode(v.as<double>()); break;
            case primitive_kind::character: enc.encode(v.as<char32_t>()); break;
            default: throw canonic::error(fmt::format("unsupported primitive kind: {}", static_cast<int>(kind)));
        }
    }

    static value decode_primitive(decoder &dec, const primitive_kind kind)
    {
        switch (kind) {
            case primitive_kind::boolean: return dec.decode<bool>();
            case primitive_kind::u8: return dec.decode<uint8_t>();
            case primitive_kind::u16: return dec.decode<uint16_t>();
            case primitive_kind::u32: return dec.decode<uint32_t>();
            case primitive_kind::u64: return dec.decode<uint64_t>();
            case primitive_kind::u128: return dec.decode<uint128_t>();
            case primitive_kind::i8: return dec.decode<int8_t>();
            case primitive_kind::i16: return dec.decode<int16_t>();
            case primitive_kind::i32: return dec.decode<int32_t>();
            case primitive_kind::i64: return dec.decode<int64_t>();
            case primitive_kind::i128: return dec.decode<int128_t>();
            case primitive_kind::f32: return dec.decode<float>();
            case primitive_kind::f64: return dec.decode<double>();
            case primitive_kind::character: return dec.decode<char32_t>();
            default: throw canonic::error(fmt::format("unsupported primitive kind: {}", static_cast<int>(kind)));
        }
    }

    // Products and sums take a nesting level of their own. A reference to any other shape takes one here,
    // so that recursion through containers such as L = option<L> is limited too.
    static bool named_target_counted(const shape &target)
    {
        return std::holds_alternative<product_shape>(target.def) || std::holds_alternative<sum_shape>(target.def);
    }

    shape_encoder::shape_encoder(sink &out, const shape_registry &reg, const limits &lim, const size_t depth):
        _out { out }, _reg { reg }, _limits { lim }, _enc { out, lim, depth }, _depth { depth }
    {
    }

    void shape_encoder::encode(const shape &s, const value &v)
    {
        std::visit([&](const auto &sd) {
            using T = std::decay_t<decltype(sd)>;
            if constexpr (std::is_same_v<T, primitive_shape>) {
                encode_primitive(_enc, sd.kind, v);
            } else if constexpr (std::is_same_v<T, product_shape>) {
                depth_guard dg { _depth, _limits.max_container_depth };
                _encode_fields(sd.fields, v.as<product_value>().fields);
            } else if constexpr (std::is_same_v<T, sum_shape>) {
                depth_guard dg { _depth, _limits.max_container_depth };
                const auto &sv = v.as<sum_value>();
                const auto *var = sd.find(sv.tag);
                if (!var) [[unlikely]]
                    throw canonic::error(fmt::format("tag {} is not a variant of {}", sv.tag, s));
                _enc.variant_tag(sv.tag);
                _encode_fields(var->fields.fields, sv.fields);
            } else if constexpr (std::is_same_v<T, string_shape>) {
                _enc.encode(v.as<std::string>());
            } else if constexpr (std::is_same_v<T, bytes_shape>) {
                _enc.encode(v.as<uint8_vector>());
            } else if constexpr (std::is_same_v<T, sequence_shape>) {
                const auto &items = v.as<sequence_value>().items;
                _enc.length(items.size());
                empty_item_counter empty { _limits.max_empty_items };
                for (const auto &item: items) {
                    const auto start = _out.size();
                    encode(*sd.element, item);
                    empty.add(start, _out.size());
                }
            } else if constexpr (std::is_same_v<T, tuple_array_shape>) {
                const auto &items = v.as<sequence_value>().items;
                if (items.size() != sd.size) [[unlikely]]
                    throw canonic::error(fmt::format("{} expects {} elements but the value has {}", s, sd.size, items.size()));
                for (const auto &item: items)
                    encode(*sd.element, item);
            } else if constexpr (std::is_same_v<T, option_shape>) {
                if (const auto &item = v.as<option_value>().item; item) {
                    _out.write(uint8_t { 1 });
                    encode(*sd.element, *item);
                } else {
                    _out.write(uint8_t { 0 });
                }
            } else if constexpr (std::is_same_v<T, map_shape>) {
                const auto &entries = v.as<map_value>().entries;
                _enc.length(entries.size());
                std::vector<encoded_entry> encoded {};
                encoded.reserve(entries.size());
                for (const auto &e: entries)
                    encoded.emplace_back(_encode_detached(*sd.key, e.key), _encode_detached(*sd.val, e.val));
                write_sorted_entries(_out, encoded);
            } else if constexpr (std::is_same_v<T, set_shape>) {
                const auto &keys = v.as<set_value>().keys;
                _enc.length(keys.size());
                std::vector<encoded_entry> encoded {};
                encoded.reserve(keys.size());
                for (const auto &k: keys)
                    encoded.emplace_back(_encode_detached(*sd.key, k), uint8_vector {});
                write_sorted_entries(_out, encoded);
            } else if constexpr (std::is_same_v<T, named_shape>) {
                const auto &target = _reg.resolve(s);
                if (named_target_counted(target))
                    return encode(target, v);
                depth_guard dg { _depth, _limits.max_container_depth };
                encode(target, v);
            } else {
                static_assert(dependent_false<T>, "unsupported shape type");
            }
        }, s.def);
    }

    void shape_encoder::_encode_fields(const shape_list &fields, const value_list &vals)
    {
        if (fields.size() != vals.size()) [[unlikely]]
            throw canonic::error(fmt::format("the shape has {} fields but the value has {}", fields.size(), vals.size()));
        for (size_t i = 0; i < fields.size(); ++i)
            encode(*fields[i], vals[i]);
    }

    uint8_vector shape_encoder::_encode_detached(const shape &s, const value &v) const
    {
        vector_sink tmp {};
        shape_encoder enc { tmp, _reg, _limits, _depth };
        enc.encode(s, v);
        return std::move(tmp.bytes());
    }

    shape_decoder::shape_decoder(source &in, const shape_registry &reg, const limits &lim):
        _in { in }, _reg { reg }, _limits { lim }, _dec { in, lim }
    {
    }

    value shape_decoder::decode(const shape &s)
    {
        return std::visit([&](const auto &sd) -> value {
            using T = std::decay_t<decltype(sd)>;
            if constexpr (std::is_same_v<T, primitive_shape>) {
                return decode_primitive(_dec, sd.kind);
            } else if constexpr (std::is_same_v<T, product_shape>) {
                depth_guard dg { _depth, _limits.max_container_depth };
                return product_value { _decode_fields(sd.fields) };
            } else if constexpr (std::is_same_v<T, sum_shape>) {
                depth_guard dg { _depth, _limits.max_container_depth };
                const auto pos = _in.pos();
                const auto tag = _dec.variant_tag();
                const auto *var = sd.find(tag);
                if (!var) [[unlikely]]
                    throw error(error_kind::unknown_variant_tag, "tag {} at offset {} is not a variant of {}", tag, pos, s);
                return sum_value { tag, _decode_fields(var->fields.fields) };
            } else if constexpr (std::is_same_v<T, string_shape>) {
                return _dec.decode<std::string>();
            } else if constexpr (std::is_same_v<T, bytes_shape>) {
                return _dec.decode<uint8_vector>();
            } else if constexpr (std::is_same_v<T, sequence_shape>) {
                const auto sz = _dec.length();
                sequence_value res {};
                res.items.reserve(std::min(static_cast<size_t>(sz), _in.remaining()));
                empty_item_counter empty { _limits.max_empty_items };
                for (size_t i = 0; i < sz; ++i) {
                    const auto start = _in.pos();
                    res.items.emplace_back(decode(*sd.element));
                    empty.add(start, _in.pos());
                }
                return res;
            } else if constexpr (std::is_same_v<T, tuple_array_shape>) {
                sequence_value res {};
                res.items.reserve(std::min(sd.size, _in.remaining()));
                for (size_t i = 0; i < sd.size; ++i)
                    res.items.emplace_back(decode(*sd.element));
                return res;
            } else if constexpr (std::is_same_v<T, option_shape>) {
                const auto pos = _in.pos();
                switch (const auto tag = _in.read_byte(); tag) {
                    case 0: return values::none();
                    case 1: return values::some(decode(*sd.element));
                    default: throw error(error_kind::invalid_option_tag, "byte 0x{:02X} at offset {}", tag, pos);
                }
            } else if constexpr (std::is_same_v<T, map_shape>) {
                const auto sz = _dec.length();
                map_value res {};
                res.entries.reserve(std::min(static_cast<size_t>(sz), _in.remaining()));
                std::optional<buffer> prev {};
                for (size_t i = 0; i < sz; ++i) {
                    const auto start = _in.pos();
                    auto k = decode(*sd.key);
                    prev = _dec.key_bytes(start, prev);
                    auto v = decode(*sd.val);
                    res.entries.emplace_back(map_entry { std::move(k), std::move(v) });
                }
                return res;
            } else if constexpr (std::is_same_v<T, set_shape>) {
                const auto sz = _dec.length();
                set_value res {};
                res.keys.reserve(std::min(static_cast<size_t>(sz), _in.remaining()));
                std::optional<buffer> prev {};
                for (size_t i = 0; i < sz; ++i) {
                    const auto start = _in.pos();
                    res.keys.emplace_back(decode(*sd.key));
                    prev = _dec.key_bytes(start, prev);
                }
                return res;
            } else if constexpr (std::is_same_v<T, named_shape>) {
                const auto &target = _reg.resolve(s);
                if (named_target_counted(target))
                    return decode(target);
                depth_guard dg { _depth, _limits.max_container_depth };
                return decode(target);
            } else {
                static_assert(dependent_false<T>, "unsupported shape type");
            }
        }, s.def);
    }

    value_list shape_decoder::_decode_fields(const shape_list &fields)
    {
        value_list res {};
        res.reserve(fields.size());
        for (const auto &f: fields)
            res.emplace_back(decode(*f));
        return res;
    }

    void encode(sink &out, const shape_registry &reg, const shape &s, const value &v, const limits &lim)
    {
        shape_encoder enc { out, reg, lim };
        enc.encode(s, v);
    }

    uint8_vector encode(const shape_registry &reg, const shape &s, const value &v, const limits &lim)
    {
        vector_sink out {};
        encode(out, reg, s, v, lim);
        return std::move(out.bytes());
    }

    value decode(const shape_registry &reg, const shape &s, const buffer data, const limits &lim)
    {
        source in { data };
        shape_decoder dec { in, reg, lim };
        auto v = dec.decode(s);
        in.ensure_empty();
        return v;
    }
}
