/*
 * encoding.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "encoding.hpp"

#include <cstddef>

namespace sandrun::isolated {

namespace {

constexpr std::string_view REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

struct SequenceCheck {
    bool valid;
    std::size_t length;  ///< Sequence length if valid, else bytes to skip
};

/**
 * Checks the sequence starting at bytes[pos]. Invalid sequences report
 * their maximal valid prefix so each one becomes a single replacement.
 */
SequenceCheck checkSequence(std::string_view bytes, std::size_t pos) noexcept {
    auto lead = static_cast<unsigned char>(bytes[pos]);
    if (lead < 0x80) {
        return {true, 1};
    }

    std::size_t need = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
    } else if (lead == 0xE0) {
        need = 2;
        lo = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        need = 2;
    } else if (lead == 0xED) {
        need = 2;
        hi = 0x9F;
    } else if (lead == 0xF0) {
        need = 3;
        lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        need = 3;
    } else if (lead == 0xF4) {
        need = 3;
        hi = 0x8F;
    } else {
        return {false, 1};
    }

    for (std::size_t i = 1; i <= need; ++i) {
        if (pos + i >= bytes.size()) {
            return {false, i};
        }
        auto c = static_cast<unsigned char>(bytes[pos + i]);
        auto low = i == 1 ? lo : static_cast<unsigned char>(0x80);
        auto high = i == 1 ? hi : static_cast<unsigned char>(0xBF);
        if (c < low || c > high) {
            return {false, i};
        }
    }
    return {true, need + 1};
}

}  // namespace

bool isValidUtf8(std::string_view bytes) noexcept {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        auto check = checkSequence(bytes, pos);
        if (!check.valid) {
            return false;
        }
        pos += check.length;
    }
    return true;
}

std::string sanitizeUtf8(std::string_view bytes) {
    if (isValidUtf8(bytes)) {
        return std::string(bytes);
    }

    std::string result;
    result.reserve(bytes.size() + 8);
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        auto check = checkSequence(bytes, pos);
        if (check.valid) {
            result.append(bytes.substr(pos, check.length));
        } else {
            result.append(REPLACEMENT_CHARACTER);
        }
        pos += check.length;
    }
    return result;
}

}  // namespace sandrun::isolated
