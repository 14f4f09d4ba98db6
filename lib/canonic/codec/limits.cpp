/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canonic/codec/limits.hpp>
#include <canonic/logger.hpp>

namespace canonic::codec {
    static std::optional<uint64_t> positive_param(const config &cfg, const std::string_view name)
    {
        const auto *val = cfg.find(name);
        if (!val)
            return {};
        if (const auto *u = val->if_uint64(); u && *u > 0)
            return *u;
        if (const auto *i = val->if_int64(); i && *i > 0)
            return static_cast<uint64_t>(*i);
        throw canonic::error(fmt::format("configuration parameter {} must be a positive integer but got: {}", name, json::serialize(*val)));
    }

    limits limits::from_config(const config &cfg)
    {
        limits res {};
        if (const auto depth = positive_param(cfg, "maxContainerDepth"); depth)
            res.max_container_depth = *depth;
        if (const auto len = positive_param(cfg, "maxSequenceLength"); len) {
            if (*len > max_uleb128_value)
                throw canonic::error(fmt::format("maxSequenceLength must not exceed {} but got: {}", max_uleb128_value, *len));
            res.max_sequence_length = *len;
        }
        if (const auto empty = positive_param(cfg, "maxEmptyItems"); empty)
            res.max_empty_items = *empty;
        logger::debug("codec {} configured", res);
        return res;
    }
}
