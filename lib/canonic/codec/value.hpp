/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_VALUE_HPP
#define CANONIC_CODEC_VALUE_HPP

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <canonic/big-int.hpp>
#include <canonic/common/bytes.hpp>
#include <canonic/common/variant.hpp>

/*
 * Dynamically-typed values that conform to a runtime shape.
 * Maps and sets keep their entries in a list; their encoding is canonical and their equality
 * does not depend on that order.
 */

namespace canonic::codec {
    struct value;
    using value_list = std::vector<value>;

    struct product_value {
        value_list fields {};

        bool operator==(const product_value &o) const;
    };

    struct sum_value {
        uint32_t tag = 0;
        value_list fields {};

        bool operator==(const sum_value &o) const;
    };

    struct sequence_value {
        value_list items {};

        bool operator==(const sequence_value &o) const;
    };

    struct option_value {
        // empty when the option is absent
        std::shared_ptr<const value> item {};

        bool operator==(const option_value &o) const;
    };

    struct map_entry;

    struct map_value {
        std::vector<map_entry> entries {};

        bool operator==(const map_value &o) const;
    };

    struct set_value {
        value_list keys {};

        bool operator==(const set_value &o) const;
    };

    struct value {
        using storage = std::variant<bool, uint8_t, uint16_t, uint32_t, uint64_t, uint128_t,
            int8_t, int16_t, int32_t, int64_t, int128_t, float, double, char32_t,
            std::string, uint8_vector, product_value, sum_value, sequence_value, option_value, map_value, set_value>;

        storage val {};

        value() =default;

        template<typename T>
            requires (!std::is_same_v<std::remove_cvref_t<T>, value>) && std::is_constructible_v<storage, T>
        value(T &&v): val { std::forward<T>(v) }
        {
        }

        template<typename T>
        const T &as() const
        {
            return variant::get_nice<T>(val);
        }

        // floating-point values are compared bit-for-bit so that NaNs round-trip
        bool operator==(const value &o) const;
        [[nodiscard]] std::string to_string() const;
    };

    struct map_entry {
        value key;
        value val;

        bool operator==(const map_entry &o) const;
    };

    namespace values {
        extern value product(value_list fields={});
        extern value unit();
        extern value sum(uint32_t tag, value_list fields={});
        extern value sequence(value_list items);
        extern value none();
        extern value some(value item);
        extern value map(std::vector<map_entry> entries);
        extern value set(value_list keys);
        extern value string(std::string_view s);
        extern value bytes(buffer b);
    }
}

namespace fmt {
    template<>
    struct formatter<canonic::codec::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !CANONIC_CODEC_VALUE_HPP
