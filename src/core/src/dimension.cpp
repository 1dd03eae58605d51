// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/dimension.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "tensorir/core/except.hpp"
#include "tensorir/util/common_util.hpp"

using namespace tir;

namespace {
// -1 is the conventional marker of a missing bound.
Dimension::value_type lower_bound(Dimension::value_type value) {
    return value == -1 ? 0 : value;
}

Dimension::value_type parse_bound(const std::string& text, const char* what) {
    const auto digits = tir::util::trim(text);
    const bool all_digits = !digits.empty() && std::all_of(digits.begin(), digits.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    TENSORIR_ASSERT(all_digits, "Cannot parse ", what, ": \"", digits, "\"");

    Dimension::value_type value{0};
    std::istringstream ss(digits);
    ss >> value;
    return value;
}
}  // namespace

Dimension::Dimension(value_type dimension) : Dimension(dimension, dimension) {}

Dimension::Dimension(value_type min_dimension, value_type max_dimension)
    : m_min(lower_bound(min_dimension)),
      m_max(max_dimension == -1 ? s_unbounded : max_dimension) {
    TENSORIR_ASSERT(m_min >= 0 && m_max >= m_min,
                    "Invalid dimension bounds [",
                    min_dimension,
                    ", ",
                    max_dimension,
                    "]");
}

Dimension::Dimension(const std::string& str) {
    const auto value = tir::util::trim(str);
    if (value == "?" || value == "-1") {
        return;
    }

    const auto range = value.find("..");
    if (range == std::string::npos) {
        m_min = m_max = parse_bound(value, "dimension");
        return;
    }

    const auto min_str = value.substr(0, range);
    const auto max_str = value.substr(range + 2);
    m_min = tir::util::trim(min_str).empty() ? 0 : parse_bound(min_str, "min bound");
    m_max = tir::util::trim(max_str).empty() ? s_unbounded : parse_bound(max_str, "max bound");
    TENSORIR_ASSERT(m_max >= m_min, "Invalid dimension bounds: \"", value, "\"");
}

Dimension::value_type Dimension::get_length() const {
    if (is_dynamic()) {
        TENSORIR_THROW("Cannot get length of dynamic dimension");
    }
    return m_min;
}

std::string Dimension::to_string() const {
    std::stringstream dim_str_stream;
    dim_str_stream << *this;
    return dim_str_stream.str();
}

std::ostream& tir::operator<<(std::ostream& str, const Dimension& dimension) {
    if (dimension.is_static()) {
        return str << dimension.get_length();
    }
    if (dimension.get_min_length() == 0 && !dimension.has_upper_bound()) {
        return str << "?";
    }
    if (dimension.get_min_length() > 0) {
        str << dimension.get_min_length();
    }
    str << "..";
    if (dimension.has_upper_bound()) {
        str << dimension.get_max_length();
    }
    return str;
}
