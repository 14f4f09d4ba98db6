/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_DECODER_HPP
#define CANONIC_CODEC_DECODER_HPP

#include <canonic/codec/encoder.hpp>

namespace canonic::codec {
    struct decoder {
        explicit decoder(source &in, const limits &lim={}):
            _in { in }, _limits { lim }
        {
        }

        template<typename... Args>
        void operator()(Args &...args)
        {
            (decode(args), ...);
        }

        template<typename T>
        T decode()
        {
            T v {};
            decode(v);
            return v;
        }

        template<typename T>
        void decode(T &v)
        {
            if constexpr (std::is_same_v<T, bool>) {
                v = primitive::decode_bool(_in);
            } else if constexpr (std::is_same_v<T, char32_t>) {
                v = primitive::decode_char(_in);
            } else if constexpr (fixed_uint<T>) {
                v = primitive::decode_uint<T>(_in);
            } else if constexpr (fixed_int<T>) {
                v = primitive::decode_int<T>(_in);
            } else if constexpr (std::is_same_v<T, float>) {
                v = primitive::decode_float(_in);
            } else if constexpr (std::is_same_v<T, double>) {
                v = primitive::decode_double(_in);
            } else if constexpr (std::is_same_v<T, uint128_t>) {
                v = primitive::decode_uint128(_in);
            } else if constexpr (std::is_same_v<T, int128_t>) {
                v = primitive::decode_int128(_in);
            } else if constexpr (std::is_same_v<T, std::string>) {
                const auto sz = length();
                const auto start = _in.pos();
                const std::string_view text = _in.read(sz);
                validate_utf8(text, start);
                v.assign(text);
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                v = _in.read(length());
            } else if constexpr (std::is_same_v<T, std::monostate>) {
                // a unit value takes no space
            } else if constexpr (is_optional<T>::value) {
                const auto pos = _in.pos();
                switch (const auto tag = _in.read_byte(); tag) {
                    case 0:
                        v.reset();
                        break;
                    case 1:
                        decode(v.emplace());
                        break;
                    default:
                        throw error(error_kind::invalid_option_tag, "byte 0x{:02X} at offset {}", tag, pos);
                }
            } else if constexpr (is_box<T>::value) {
                using VT = typename T::element_type;
                auto item = std::make_unique<VT>();
                decode(*item);
                v = std::move(item);
            } else if constexpr (is_variant<T>::value) {
                depth_guard dg { _depth, _limits.max_container_depth };
                const auto pos = _in.pos();
                const auto tag = variant_tag();
                if (tag >= std::variant_size_v<T>) [[unlikely]]
                    throw error(error_kind::unknown_variant_tag, "tag {} at offset {} while the type has {} variants", tag, pos, std::variant_size_v<T>);
                _decode_alternative(tag, v);
            } else if constexpr (is_std_array<T>::value) {
                for (auto &item: v)
                    decode(item);
            } else if constexpr (is_tuple<T>::value) {
                depth_guard dg { _depth, _limits.max_container_depth };
                std::apply([this](auto &...items) { (decode(items), ...); }, v);
            } else if constexpr (map_like<T>) {
                _decode_map(v);
            } else if constexpr (set_like<T>) {
                _decode_set(v);
            } else if constexpr (sequence_like<T>) {
                const auto sz = length();
                v.clear();
                if constexpr (requires { v.reserve(sz); }) {
                    // every element takes at least one byte unless it is a unit, so do not trust large lengths
                    v.reserve(std::min(static_cast<size_t>(sz), _in.remaining()));
                }
                empty_item_counter empty { _limits.max_empty_items };
                for (size_t i = 0; i < sz; ++i) {
                    const auto start = _in.pos();
                    typename T::value_type item {};
                    decode(item);
                    empty.add(start, _in.pos());
                    v.emplace_back(std::move(item));
                }
            } else if constexpr (serializable_with<decoder, T>) {
                depth_guard dg { _depth, _limits.max_container_depth };
                T::serialize(*this, v);
            } else {
                static_assert(dependent_false<T>, "the type has no canonical encoding");
            }
        }

        uint32_t length()
        {
            const auto pos = _in.pos();
            const auto sz = uleb128::decode(_in);
            if (sz > _limits.max_sequence_length) [[unlikely]]
                throw error(error_kind::length_overflow, "length {} at offset {} exceeds the maximum of {}", sz, pos, _limits.max_sequence_length);
            return sz;
        }

        uint32_t variant_tag()
        {
            return uleb128::decode(_in);
        }

        [[nodiscard]] source &input() noexcept
        {
            return _in;
        }

        // Keys must come in strictly ascending order of their encoded bytes.
        // The returned buffer points into the input data.
        buffer key_bytes(const size_t start, const std::optional<buffer> &prev) const
        {
            const auto curr = _in.consumed_since(start);
            if (prev) {
                if (const auto cmp = *prev <=> curr; cmp == std::strong_ordering::equal) [[unlikely]]
                    throw error(error_kind::duplicate_key, "key {} at offset {} repeats the previous one", curr, start);
                else if (cmp == std::strong_ordering::greater) [[unlikely]]
                    throw error(error_kind::map_not_canonically_ordered, "key {} at offset {} is smaller than the previous key {}", curr, start, *prev);
            }
            return curr;
        }
    private:
        source &_in;
        const limits _limits;
        size_t _depth = 0;

        template<size_t I=0, typename V>
        void _decode_alternative(const size_t tag, V &v)
        {
            if constexpr (I < std::variant_size_v<V>) {
                if (tag == I) {
                    decode(v.template emplace<I>());
                    return;
                }
                _decode_alternative<I + 1>(tag, v);
            }
        }

        template<typename M>
        void _decode_map(M &m)
        {
            const auto sz = length();
            m.clear();
            std::optional<buffer> prev {};
            for (size_t i = 0; i < sz; ++i) {
                const auto start = _in.pos();
                typename M::key_type k {};
                decode(k);
                prev = key_bytes(start, prev);
                typename M::mapped_type v {};
                decode(v);
                if (const auto [it, created] = m.emplace(std::move(k), std::move(v)); !created) [[unlikely]]
                    throw error(error_kind::duplicate_key, "key {} at offset {} is equivalent to an earlier one", *prev, start);
            }
        }

        template<typename S>
        void _decode_set(S &s)
        {
            const auto sz = length();
            s.clear();
            std::optional<buffer> prev {};
            for (size_t i = 0; i < sz; ++i) {
                const auto start = _in.pos();
                typename S::key_type k {};
                decode(k);
                prev = key_bytes(start, prev);
                if (const auto [it, created] = s.emplace(std::move(k)); !created) [[unlikely]]
                    throw error(error_kind::duplicate_key, "key {} at offset {} is equivalent to an earlier one", *prev, start);
            }
        }
    };
}

#endif // !CANONIC_CODEC_DECODER_HPP
