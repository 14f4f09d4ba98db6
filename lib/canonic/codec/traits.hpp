/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_TRAITS_HPP
#define CANONIC_CODEC_TRAITS_HPP

#include <array>
#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <canonic/big-int.hpp>
#include <canonic/common/bytes.hpp>

/*
 * Maps C++ types to the shapes of the format:
 * products are std::pair, std::tuple, and structs with a static serialize(archive, self) member
 * that passes the fields to the archive in their declaration order;
 * sums are std::variant with the alternative's index used as the variant tag;
 * boxes (std::unique_ptr, std::shared_ptr) are transparent and allow recursive types.
 */

namespace canonic::codec {
    template<typename T>
    struct is_optional: std::false_type {};
    template<typename T>
    struct is_optional<std::optional<T>>: std::true_type {};

    template<typename T>
    struct is_variant: std::false_type {};
    template<typename... Ts>
    struct is_variant<std::variant<Ts...>>: std::true_type {};

    template<typename T>
    struct is_std_array: std::false_type {};
    template<typename T, size_t SZ>
    struct is_std_array<std::array<T, SZ>>: std::true_type {};

    template<typename T>
    struct is_tuple: std::false_type {};
    template<typename X, typename Y>
    struct is_tuple<std::pair<X, Y>>: std::true_type {};
    template<typename... Ts>
    struct is_tuple<std::tuple<Ts...>>: std::true_type {};

    template<typename T>
    struct is_box: std::false_type {};
    template<typename T>
    struct is_box<std::unique_ptr<T>>: std::true_type {};
    template<typename T>
    struct is_box<std::shared_ptr<T>>: std::true_type {};

    template<typename T>
    concept fixed_uint = std::unsigned_integral<T> && !std::same_as<T, bool> && !std::same_as<T, char>
        && !std::same_as<T, char8_t> && !std::same_as<T, char16_t> && !std::same_as<T, char32_t>;

    template<typename T>
    concept fixed_int = std::signed_integral<T> && !std::same_as<T, char>;

    template<typename T>
    concept map_like = requires(T &m, const T &cm, typename T::key_type k, typename T::mapped_type v) {
        { cm.size() } -> std::convertible_to<size_t>;
        cm.begin();
        m.clear();
        m.emplace(std::move(k), std::move(v));
    };

    template<typename T>
    concept set_like = !map_like<T> && std::same_as<typename T::key_type, typename T::value_type>
        && requires(T &s, const T &cs, typename T::key_type k) {
            { cs.size() } -> std::convertible_to<size_t>;
            cs.begin();
            s.clear();
            s.emplace(std::move(k));
        };

    template<typename T>
    concept sequence_like = !map_like<T> && !std::same_as<T, std::string>
        && requires(T &s, const T &cs, typename T::value_type v) {
            { cs.size() } -> std::convertible_to<size_t>;
            cs.begin();
            s.clear();
            s.emplace_back(std::move(v));
        };

    template<typename A, typename T>
    concept serializable_with = requires(A &archive, T &self) {
        std::remove_cvref_t<T>::serialize(archive, self);
    };

    template<typename>
    inline constexpr bool dependent_false = false;
}

#endif // !CANONIC_CODEC_TRAITS_HPP
