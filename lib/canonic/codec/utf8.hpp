/* This file is part of Canonic project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef CANONIC_CODEC_UTF8_HPP
#define CANONIC_CODEC_UTF8_HPP

#include <utf8cpp/utf8.h>
#include <canonic/codec/error.hpp>

namespace canonic::codec {
    // base_offset is the position of the text within the encoded data and is used only for error reporting
    inline void validate_utf8(const std::string_view text, const size_t base_offset)
    {
        if (const auto it = utf8::find_invalid(text.begin(), text.end()); it != text.end()) [[unlikely]]
            throw error(error_kind::invalid_utf8, "a malformed sequence at offset {}", base_offset + static_cast<size_t>(it - text.begin()));
    }
}

#endif // !CANONIC_CODEC_UTF8_HPP
