// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include "tensorir/core/core_visibility.hpp"

namespace tir {
/// \brief Class representing a dimension, which may be dynamic (undetermined until runtime),
///        in a shape or shape-like object.
///
/// Static dimensions may be implicitly converted from value_type. A dynamic dimension is
/// constructed with Dimension() or Dimension::dynamic().
/// \brief Extent of one tensor axis: a single known length, or a range of lengths
/// `[min, max]` where the upper end may be unbounded.
class TENSORIR_API Dimension {
public:
    using value_type = int64_t;

    /// \brief Construct a static dimension.
    /// \param dimension Value of the dimension.
    Dimension(value_type dimension);

    /// \brief Construct a dynamic dimension with bounded range
    /// \param min_dimension The lower inclusive limit for the dimension
    /// \param max_dimension The upper inclusive limit for the dimension
    Dimension(value_type min_dimension, value_type max_dimension);

    /// \brief Construct a dimension from string.
    /// \param str String to parse to dimension.
    Dimension(const std::string& str);

    /// \brief Create a dynamic dimension.
    Dimension() = default;

    bool operator==(const Dimension& dimension) const {
        return m_min == dimension.m_min && m_max == dimension.m_max;
    }
    bool operator!=(const Dimension& dimension) const {
        return !(*this == dimension);
    }
    /// \brief Check whether this dimension is static.
    /// \return `true` if the dimension is static, else `false`.
    bool is_static() const {
        return m_min == m_max;
    }
    /// \brief Check whether this dimension is dynamic.
    /// \return `false` if the dimension is static, else `true`.
    bool is_dynamic() const {
        return m_min != m_max;
    }
    /// \brief Convert this dimension to `value_type`. This dimension must be static and
    ///        non-negative.
    /// \throws tir::Exception If this dimension is dynamic.
    value_type get_length() const;

    value_type get_min_length() const {
        return m_min;
    }
    /// \return The upper bound, or -1 if the dimension is unbounded.
    value_type get_max_length() const {
        return has_upper_bound() ? m_max : -1;
    }
    bool has_upper_bound() const {
        return m_max != s_unbounded;
    }
    /// \brief Create a dynamic dimension.
    /// \return A dynamic dimension.
    static Dimension dynamic() {
        return Dimension();
    }

    /// \brief String representation of Dimension
    std::string to_string() const;

private:
    static constexpr value_type s_unbounded{std::numeric_limits<value_type>::max()};

    value_type m_min{0};
    value_type m_max{s_unbounded};
};

/// \brief Insert a human-readable representation of a dimension into an output stream.
/// \param str The output stream targeted for insertion.
/// \param dimension The dimension to be inserted into `str`.
/// \return A reference to `str` after insertion.
///
/// Inserts the string `?` if `dimension` is dynamic; else inserts `dimension.get_length()`.
TENSORIR_API
std::ostream& operator<<(std::ostream& str, const Dimension& dimension);

}  // namespace tir
