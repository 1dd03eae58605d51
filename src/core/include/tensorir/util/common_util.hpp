// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>

#include "tensorir/core/core_visibility.hpp"

namespace tir {
namespace util {

template <typename T>
std::string join(const T& v, const std::string& sep = ", ") {
    std::ostringstream ss;
    size_t count = 0;
    for (const auto& x : v) {
        if (count++ > 0) {
            ss << sep;
        }
        ss << x;
    }
    return ss.str();
}

TENSORIR_API std::string to_lower(const std::string& s);

TENSORIR_API std::string trim(const std::string& s);

/// \brief Removes the project root prefix from a source path so that messages carry
/// repository-relative file names.
TENSORIR_API std::string trim_file_name(const std::string& file_name);

/// \brief Integer division rounding towards negative infinity.
template <typename T, typename std::enable_if<std::is_signed<T>::value, bool>::type = true>
constexpr T floor_div(const T x, const T y) {
    return x / y - static_cast<T>((x % y != 0) && ((x < 0) != (y < 0)));
}

/// \brief Integer division rounding towards positive infinity.
template <typename T, typename std::enable_if<std::is_signed<T>::value, bool>::type = true>
constexpr T ceil_div(const T x, const T y) {
    return x / y + static_cast<T>((x % y != 0) && ((x < 0) == (y < 0)));
}

}  // namespace util
}  // namespace tir
