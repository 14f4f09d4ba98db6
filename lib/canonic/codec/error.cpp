/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canonic/codec/error.hpp>

namespace canonic::codec {
    const char *error_kind_name(const error_kind kind)
    {
        switch (kind) {
            case error_kind::unexpected_end_of_input: return "unexpected end of input";
            case error_kind::invalid_boolean: return "non-canonical boolean";
            case error_kind::invalid_char: return "invalid char";
            case error_kind::invalid_option_tag: return "invalid option tag";
            case error_kind::unknown_variant_tag: return "unknown variant";
            case error_kind::non_canonical_length: return "non-canonical length";
            case error_kind::length_overflow: return "length overflow";
            case error_kind::invalid_utf8: return "invalid string encoding";
            case error_kind::map_not_canonically_ordered: return "map not canonically ordered";
            case error_kind::duplicate_key: return "duplicate key";
            case error_kind::trailing_data: return "trailing data";
            case error_kind::recursion_limit_exceeded: return "recursion limit exceeded";
            case error_kind::sink_exhausted: return "sink exhausted";
            case error_kind::value_out_of_range: return "value out of range";
            default: throw canonic::error(fmt::format("unsupported error kind: {}", static_cast<int>(kind)));
        }
    }
}
