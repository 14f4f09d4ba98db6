/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_ENCODER_HPP
#define CANONIC_CODEC_ENCODER_HPP

#include <algorithm>
#include <vector>
#include <canonic/codec/limits.hpp>
#include <canonic/codec/primitive.hpp>
#include <canonic/codec/traits.hpp>
#include <canonic/codec/uleb128.hpp>
#include <canonic/codec/utf8.hpp>

namespace canonic::codec {
    // Counts the nesting of products and sums. Shared by the encoders and decoders.
    struct depth_guard {
        depth_guard(const depth_guard &) =delete;

        explicit depth_guard(size_t &depth, const size_t max_depth): _depth { depth }
        {
            if (_depth >= max_depth) [[unlikely]]
                throw error(error_kind::recursion_limit_exceeded, "nesting depth exceeds the maximum of {}", max_depth);
            ++_depth;
        }

        ~depth_guard()
        {
            --_depth;
        }
    private:
        size_t &_depth;
    };

    // Counts the elements of a sequence whose encoding takes no bytes.
    // Their number is not bounded by the size of the input, so it has a limit of its own.
    struct empty_item_counter {
        explicit empty_item_counter(const size_t max_items): _max { max_items }
        {
        }

        void add(const size_t start, const size_t end)
        {
            if (start == end && ++_count > _max) [[unlikely]]
                throw error(error_kind::length_overflow, "more than {} sequence elements take no space", _max);
        }
    private:
        const size_t _max;
        size_t _count = 0;
    };

    // a map or set entry encoded in isolation so that entries can be ordered by their key bytes
    using encoded_entry = std::pair<uint8_vector, uint8_vector>;

    inline void write_sorted_entries(sink &out, std::vector<encoded_entry> &entries)
    {
        std::sort(entries.begin(), entries.end(), [](const auto &a, const auto &b) {
            return a.first < b.first;
        });
        for (size_t i = 1; i < entries.size(); ++i) {
            if (entries[i - 1].first == entries[i].first) [[unlikely]]
                throw error(error_kind::duplicate_key, "two entries share the encoded key {}", entries[i].first);
        }
        for (const auto &[k, v]: entries) {
            out.write(k);
            out.write(v);
        }
    }

    struct encoder {
        explicit encoder(sink &out, const limits &lim={}, const size_t depth=0):
            _out { out }, _limits { lim }, _depth { depth }
        {
        }

        template<typename... Args>
        void operator()(const Args &...args)
        {
            (encode(args), ...);
        }

        template<typename T>
        void encode(const T &v)
        {
            using TV = std::remove_cvref_t<T>;
            if constexpr (std::is_same_v<TV, bool>) {
                primitive::encode_bool(_out, v);
            } else if constexpr (std::is_same_v<TV, char32_t>) {
                primitive::encode_char(_out, v);
            } else if constexpr (fixed_uint<TV>) {
                primitive::encode_uint(_out, v);
            } else if constexpr (fixed_int<TV>) {
                primitive::encode_int(_out, v);
            } else if constexpr (std::is_same_v<TV, float>) {
                primitive::encode_float(_out, v);
            } else if constexpr (std::is_same_v<TV, double>) {
                primitive::encode_double(_out, v);
            } else if constexpr (std::is_same_v<TV, uint128_t>) {
                primitive::encode_uint128(_out, v);
            } else if constexpr (std::is_same_v<TV, int128_t>) {
                primitive::encode_int128(_out, v);
            } else if constexpr (std::is_same_v<TV, std::string>) {
                validate_utf8(v, _out.size());
                length(v.size());
                _out.write(buffer { v });
            } else if constexpr (std::is_same_v<TV, uint8_vector>) {
                length(v.size());
                _out.write(buffer { v });
            } else if constexpr (std::is_same_v<TV, std::monostate>) {
                // a unit value takes no space
            } else if constexpr (is_optional<TV>::value) {
                if (v) {
                    _out.write(uint8_t { 1 });
                    encode(*v);
                } else {
                    _out.write(uint8_t { 0 });
                }
            } else if constexpr (is_box<TV>::value) {
                if (!v) [[unlikely]]
                    throw canonic::error(fmt::format("cannot encode an empty box of type {}", typeid(TV).name()));
                encode(*v);
            } else if constexpr (is_variant<TV>::value) {
                depth_guard dg { _depth, _limits.max_container_depth };
                variant_tag(v.index());
                std::visit([this](const auto &alt) { encode(alt); }, v);
            } else if constexpr (is_std_array<TV>::value) {
                for (const auto &item: v)
                    encode(item);
            } else if constexpr (is_tuple<TV>::value) {
                depth_guard dg { _depth, _limits.max_container_depth };
                std::apply([this](const auto &...items) { (encode(items), ...); }, v);
            } else if constexpr (map_like<TV>) {
                _encode_map(v);
            } else if constexpr (set_like<TV>) {
                _encode_set(v);
            } else if constexpr (sequence_like<TV>) {
                length(v.size());
                empty_item_counter empty { _limits.max_empty_items };
                for (const auto &item: v) {
                    const auto start = _out.size();
                    encode(item);
                    empty.add(start, _out.size());
                }
            } else if constexpr (serializable_with<encoder, const TV>) {
                depth_guard dg { _depth, _limits.max_container_depth };
                TV::serialize(*this, v);
            } else {
                static_assert(dependent_false<TV>, "the type has no canonical encoding");
            }
        }

        void length(const size_t sz)
        {
            if (sz > _limits.max_sequence_length) [[unlikely]]
                throw error(error_kind::length_overflow, "length {} exceeds the maximum of {}", sz, _limits.max_sequence_length);
            uleb128::encode(_out, sz);
        }

        void variant_tag(const uint64_t tag)
        {
            uleb128::encode(_out, tag);
        }

        [[nodiscard]] size_t depth() const noexcept
        {
            return _depth;
        }
    private:
        sink &_out;
        const limits _limits;
        size_t _depth;

        // encodes an item in isolation so that its bytes can be compared before they are written out
        template<typename T>
        uint8_vector _encode_detached(const T &v) const
        {
            vector_sink tmp {};
            encoder enc { tmp, _limits, _depth };
            enc.encode(v);
            return std::move(tmp.bytes());
        }

        template<typename M>
        void _encode_map(const M &m)
        {
            length(m.size());
            std::vector<encoded_entry> entries {};
            entries.reserve(m.size());
            for (const auto &[k, v]: m)
                entries.emplace_back(_encode_detached(k), _encode_detached(v));
            write_sorted_entries(_out, entries);
        }

        template<typename S>
        void _encode_set(const S &s)
        {
            length(s.size());
            std::vector<encoded_entry> entries {};
            entries.reserve(s.size());
            for (const auto &k: s)
                entries.emplace_back(_encode_detached(k), uint8_vector {});
            write_sorted_entries(_out, entries);
        }
    };
}

#endif // !CANONIC_CODEC_ENCODER_HPP
