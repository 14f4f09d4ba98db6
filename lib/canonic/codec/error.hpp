/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_ERROR_HPP
#define CANONIC_CODEC_ERROR_HPP

#include <canonic/common/error.hpp>
#include <canonic/common/format.hpp>

namespace canonic::codec {
    enum class error_kind: uint8_t {
        unexpected_end_of_input,
        invalid_boolean,
        invalid_char,
        invalid_option_tag,
        unknown_variant_tag,
        non_canonical_length,
        length_overflow,
        invalid_utf8,
        map_not_canonically_ordered,
        duplicate_key,
        trailing_data,
        recursion_limit_exceeded,
        sink_exhausted,
        value_out_of_range
    };

    extern const char *error_kind_name(error_kind kind);

    // The only exception type thrown for malformed, non-canonical, or out-of-limits data.
    // Usage errors such as shape mismatches are reported with canonic::error.
    struct error: canonic::error {
        template<typename... Args>
        explicit error(const error_kind kind, const fmt::format_string<Args...> &fmt, Args&&... a):
            canonic::error { fmt::format("{}: {}", error_kind_name(kind), fmt::format(fmt, std::forward<Args>(a)...)) },
            _kind { kind }
        {
        }

        [[nodiscard]] error_kind kind() const noexcept
        {
            return _kind;
        }
    private:
        error_kind _kind;
    };
}

namespace fmt {
    template<>
    struct formatter<canonic::codec::error_kind>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const canonic::codec::error_kind &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(canonic::codec::error_kind_name(v), ctx);
        }
    };
}

#endif // !CANONIC_CODEC_ERROR_HPP
