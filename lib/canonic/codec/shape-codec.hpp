/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_SHAPE_CODEC_HPP
#define CANONIC_CODEC_SHAPE_CODEC_HPP

#include <canonic/codec/decoder.hpp>
#include <canonic/codec/encoder.hpp>
#include <canonic/codec/shape.hpp>
#include <canonic/codec/value.hpp>

/*
 * Encodes and decodes dynamic values driven by a runtime shape.
 * Produces the same bytes as the static bindings of a C++ type with the same shape.
 * A value that does not conform to its shape is reported with canonic::error.
 */

namespace canonic::codec {
    struct shape_encoder {
        explicit shape_encoder(sink &out, const shape_registry &reg, const limits &lim={}, size_t depth=0);
        void encode(const shape &s, const value &v);
    private:
        sink &_out;
        const shape_registry &_reg;
        const limits _limits;
        encoder _enc;
        size_t _depth;

        void _encode_fields(const shape_list &fields, const value_list &vals);
        uint8_vector _encode_detached(const shape &s, const value &v) const;
    };

    struct shape_decoder {
        explicit shape_decoder(source &in, const shape_registry &reg, const limits &lim={});
        value decode(const shape &s);
    private:
        source &_in;
        const shape_registry &_reg;
        const limits _limits;
        decoder _dec;
        size_t _depth = 0;

        value_list _decode_fields(const shape_list &fields);
    };

    extern void encode(sink &out, const shape_registry &reg, const shape &s, const value &v, const limits &lim={});
    extern uint8_vector encode(const shape_registry &reg, const shape &s, const value &v, const limits &lim={});
    // the data must hold exactly one canonically-encoded value
    extern value decode(const shape_registry &reg, const shape &s, buffer data, const limits &lim={});
}

#endif // !CANONIC_CODEC_SHAPE_CODEC_HPP
