/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <bit>
#include <canonic/codec/value.hpp>

namespace canonic::codec {
    bool product_value::operator==(const product_value &o) const
    {
        return fields == o.fields;
    }

    bool sum_value::operator==(const sum_value &o) const
    {
        return tag == o.tag && fields == o.fields;
    }

    bool sequence_value::operator==(const sequence_value &o) const
    {
        return items == o.items;
    }

    bool option_value::operator==(const option_value &o) const
    {
        if (!item || !o.item)
            return !item && !o.item;
        return *item == *o.item;
    }

    // the order of entries is not a part of a map's or a set's identity: the encoding sorts them
    bool map_value::operator==(const map_value &o) const
    {
        return std::is_permutation(entries.begin(), entries.end(), o.entries.begin(), o.entries.end());
    }

    bool set_value::operator==(const set_value &o) const
    {
        return std::is_permutation(keys.begin(), keys.end(), o.keys.begin(), o.keys.end());
    }

    bool map_entry::operator==(const map_entry &o) const
    {
        return key == o.key && val == o.val;
    }

    bool value::operator==(const value &o) const
    {
        if (val.index() != o.val.index())
            return false;
        return std::visit([&](const auto &a) {
            using T = std::decay_t<decltype(a)>;
            const auto &b = std::get<T>(o.val);
            if constexpr (std::is_same_v<T, float>) {
                return std::bit_cast<uint32_t>(a) == std::bit_cast<uint32_t>(b);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::bit_cast<uint64_t>(a) == std::bit_cast<uint64_t>(b);
            } else {
                return a == b;
            }
        }, val);
    }

    static std::string list_to_string(const value_list &items, const char open, const char close)
    {
        std::string res { open };
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0)
                res += ", ";
            res += items[i].to_string();
        }
        res += close;
        return res;
    }

    std::string value::to_string() const
    {
        return std::visit([](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, uint8_t> || std::is_same_v<T, int8_t>) {
                return fmt::format("{}", static_cast<int>(v));
            } else if constexpr (std::is_same_v<T, char32_t>) {
                return fmt::format("U+{:04X}", static_cast<uint32_t>(v));
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                return fmt::format("#{}", v);
            } else if constexpr (std::is_same_v<T, product_value>) {
                return list_to_string(v.fields, '(', ')');
            } else if constexpr (std::is_same_v<T, sum_value>) {
                return fmt::format("#{}{}", v.tag, list_to_string(v.fields, '(', ')'));
            } else if constexpr (std::is_same_v<T, sequence_value>) {
                return list_to_string(v.items, '[', ']');
            } else if constexpr (std::is_same_v<T, option_value>) {
                return v.item ? fmt::format("some({})", v.item->to_string()) : std::string { "none" };
            } else if constexpr (std::is_same_v<T, map_value>) {
                std::string res { "{" };
                for (size_t i = 0; i < v.entries.size(); ++i) {
                    if (i > 0)
                        res += ", ";
                    res += fmt::format("{}: {}", v.entries[i].key.to_string(), v.entries[i].val.to_string());
                }
                res += '}';
                return res;
            } else if constexpr (std::is_same_v<T, set_value>) {
                return list_to_string(v.keys, '{', '}');
            } else {
                return fmt::format("{}", v);
            }
        }, val);
    }

    namespace values {
        value product(value_list fields)
        {
            return product_value { std::move(fields) };
        }

        value unit()
        {
            return product_value {};
        }

        value sum(const uint32_t tag, value_list fields)
        {
            return sum_value { tag, std::move(fields) };
        }

        value sequence(value_list items)
        {
            return sequence_value { std::move(items) };
        }

        value none()
        {
            return option_value {};
        }

        value some(value item)
        {
            return option_value { std::make_shared<const value>(std::move(item)) };
        }

        value map(std::vector<map_entry> entries)
        {
            return map_value { std::move(entries) };
        }

        value set(value_list keys)
        {
            return set_value { std::move(keys) };
        }

        value string(const std::string_view s)
        {
            return std::string { s };
        }

        value bytes(const buffer b)
        {
            return uint8_vector { b };
        }
    }
}
