/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <canonic/config.hpp>
#include <canonic/logger.hpp>

namespace canonic {
    static json::object parse_object(const std::string &path, const buffer raw)
    {
        try {
            auto val = json::parse(raw);
            if (!val.is_object())
                throw error(fmt::format("configuration file {} must contain a JSON object!", path));
            return std::move(val.as_object());
        } catch (const boost::system::system_error &ex) {
            throw error(fmt::format("failed to parse configuration file {}", path), ex);
        }
    }

    config_file::config_file(const std::string &path)
            : _raw { file::read(path) }, _parsed { parse_object(path, _raw) }
    {
        logger::debug("loaded configuration file {} with {} elements", path, _parsed.size());
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file does not have the element {}!", name));
        return it->value();
    }
}
