/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_SOURCE_HPP
#define CANONIC_CODEC_SOURCE_HPP

#include <canonic/common/bytes.hpp>
#include <canonic/codec/error.hpp>

namespace canonic::codec {
    // A bounds-checked forward-only cursor over an encoded value.
    // Returned buffers point into the underlying data and are valid only as long as it is.
    struct source {
        explicit source(const buffer data) noexcept: _data { data }
        {
        }

        buffer read(const size_t sz)
        {
            if (sz > remaining()) [[unlikely]]
                throw error(error_kind::unexpected_end_of_input, "need {} bytes at offset {} but only {} are available", sz, _pos, remaining());
            const buffer res { _data.data() + _pos, sz };
            _pos += sz;
            return res;
        }

        uint8_t read_byte()
        {
            if (_pos >= _data.size()) [[unlikely]]
                throw error(error_kind::unexpected_end_of_input, "need 1 byte at offset {} but the input has ended", _pos);
            return _data[_pos++];
        }

        // the bytes consumed since the given position
        [[nodiscard]] buffer consumed_since(const size_t start) const
        {
            return _data.subbuf(start, _pos - start);
        }

        void ensure_empty() const
        {
            if (_pos != _data.size()) [[unlikely]]
                throw error(error_kind::trailing_data, "{} unconsumed bytes after a value ending at offset {}", remaining(), _pos);
        }

        [[nodiscard]] size_t pos() const noexcept
        {
            return _pos;
        }

        [[nodiscard]] size_t remaining() const noexcept
        {
            return _data.size() - _pos;
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return _pos == _data.size();
        }
    private:
        const buffer _data;
        size_t _pos = 0;
    };
}

#endif // !CANONIC_CODEC_SOURCE_HPP
