/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_LIMITS_HPP
#define CANONIC_CODEC_LIMITS_HPP

#include <cstdint>
#include <limits>
#include <canonic/config.hpp>

namespace canonic::codec {
    // Lengths and variant tags are decoded as 32-bit values
    static constexpr uint64_t max_uleb128_value = std::numeric_limits<uint32_t>::max();
    static constexpr size_t default_max_sequence_length = (1ULL << 31) - 1;
    static constexpr size_t default_max_container_depth = 500;
    static constexpr size_t default_max_empty_items = 1 << 16;

    struct limits {
        // the number of nested products and sums (structs, tuples, enums) a value may have
        size_t max_container_depth = default_max_container_depth;
        // the maximum number of elements in a sequence, map, or set, and of bytes in a string or blob
        size_t max_sequence_length = default_max_sequence_length;
        // the maximum number of elements of a sequence that take no space, such as units,
        // since their count is not bounded by the size of the input
        size_t max_empty_items = default_max_empty_items;

        static limits from_config(const config &cfg);

        bool operator==(const limits &o) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<canonic::codec::limits>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "limits(depth: {} length: {} empty items: {})", v.max_container_depth, v.max_sequence_length, v.max_empty_items);
        }
    };
}

#endif // !CANONIC_CODEC_LIMITS_HPP
