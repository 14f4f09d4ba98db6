/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_BIG_INT_HPP
#define CANONIC_BIG_INT_HPP

#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <sstream>
#include <boost/multiprecision/cpp_int.hpp>
#include <canonic/common/format.hpp>

namespace canonic {
    using boost::multiprecision::uint128_t;
    // sign-magnitude: its range is wider than that of a two's complement 128-bit integer
    using boost::multiprecision::int128_t;
}

namespace fmt {
    template<typename T, boost::multiprecision::expression_template_option ET>
    struct formatter<boost::multiprecision::number<T, ET>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif //CANONIC_BIG_INT_HPP
