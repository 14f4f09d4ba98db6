/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_CODEC_HPP
#define CANONIC_CODEC_CODEC_HPP

#include <canonic/codec/decoder.hpp>
#include <canonic/codec/encoder.hpp>

namespace canonic::codec {
    template<typename T>
    void serialize(sink &out, const T &v, const limits &lim={})
    {
        encoder enc { out, lim };
        enc.encode(v);
    }

    template<typename T>
    uint8_vector serialize(const T &v, const limits &lim={})
    {
        vector_sink out {};
        serialize(out, v, lim);
        return std::move(out.bytes());
    }

    // The data must be exactly the canonical encoding of a value: nothing more, nothing less.
    template<typename T>
    void deserialize(const buffer data, T &v, const limits &lim={})
    {
        source in { data };
        decoder dec { in, lim };
        dec.decode(v);
        in.ensure_empty();
    }

    template<typename T>
    T deserialize(const buffer data, const limits &lim={})
    {
        T v {};
        deserialize(data, v, lim);
        return v;
    }
}

#endif // !CANONIC_CODEC_CODEC_HPP
