/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_SINK_HPP
#define CANONIC_CODEC_SINK_HPP

#include <optional>
#include <canonic/common/bytes.hpp>
#include <canonic/codec/error.hpp>

namespace canonic::codec {
    struct sink {
        virtual ~sink() =default;

        void write(const buffer bytes)
        {
            _write_impl(bytes);
        }

        void write(const uint8_t b)
        {
            _write_impl(buffer { &b, 1 });
        }

        // the number of bytes written so far
        [[nodiscard]] size_t size() const
        {
            return _size_impl();
        }
    private:
        virtual void _write_impl(buffer bytes) =0;
        virtual size_t _size_impl() const =0;
    };

    struct vector_sink: sink {
        explicit vector_sink(const std::optional<size_t> max_size={}): _max_size { max_size }
        {
        }

        [[nodiscard]] const uint8_vector &bytes() const
        {
            return _bytes;
        }

        [[nodiscard]] uint8_vector &bytes()
        {
            return _bytes;
        }
    private:
        const std::optional<size_t> _max_size;
        uint8_vector _bytes {};

        void _write_impl(const buffer bytes) override
        {
            if (_max_size && bytes.size() > *_max_size - _bytes.size()) [[unlikely]]
                throw error(error_kind::sink_exhausted, "cannot write {} bytes: {} of {} bytes are used", bytes.size(), _bytes.size(), *_max_size);
            _bytes << bytes;
        }

        size_t _size_impl() const override
        {
            return _bytes.size();
        }
    };

    // Writes into caller-owned memory of a fixed size
    struct span_sink: sink {
        explicit span_sink(const write_buffer out): _out { out }
        {
        }

        [[nodiscard]] buffer bytes() const
        {
            return buffer { _out.data(), _pos };
        }
    private:
        const write_buffer _out;
        size_t _pos = 0;

        void _write_impl(const buffer bytes) override
        {
            if (bytes.size() > _out.size() - _pos) [[unlikely]]
                throw error(error_kind::sink_exhausted, "cannot write {} bytes: {} of {} bytes are used", bytes.size(), _pos, _out.size());
            if (!bytes.empty())
                memcpy(_out.data() + _pos, bytes.data(), bytes.size());
            _pos += bytes.size();
        }

        size_t _size_impl() const override
        {
            return _pos;
        }
    };
}

#endif // !CANONIC_CODEC_SINK_HPP
