/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_COMMON_VARIANT_HPP
#define CANONIC_COMMON_VARIANT_HPP

#include <utility>
#include <variant>
#include <canonic/common/error.hpp>
#include <canonic/common/format.hpp>

namespace canonic::variant {
    // std::get with an exception that names both the expected and the held alternative
    template<typename TO, typename FROM>
    const TO &get_nice(const FROM &v)
    {
        if (const auto *p = std::get_if<TO>(&v); p) [[likely]]
            return *p;
        const auto held = std::visit([](const auto &vo) { return typeid(vo).name(); }, v);
        throw error(fmt::format("expected type {} but got {}", typeid(TO).name(), held));
    }

    template<typename TO, typename FROM>
    TO &get_nice(FROM &v)
    {
        return const_cast<TO &>(get_nice<TO>(std::as_const(v)));
    }
}

#endif // !CANONIC_COMMON_VARIANT_HPP
