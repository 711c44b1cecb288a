/*
 * encoding.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SANDRUN_ISOLATED_ENCODING_HPP
#define SANDRUN_ISOLATED_ENCODING_HPP

#include <string>
#include <string_view>

namespace sandrun::isolated {

/**
 * @brief Check whether bytes form well-formed UTF-8
 */
[[nodiscard]] bool isValidUtf8(std::string_view bytes) noexcept;

/**
 * @brief Decode bytes as UTF-8, replacing each invalid sequence with U+FFFD
 *
 * Valid input is returned unchanged.
 */
[[nodiscard]] std::string sanitizeUtf8(std::string_view bytes);

}  // namespace sandrun::isolated

#endif  // SANDRUN_ISOLATED_ENCODING_HPP
