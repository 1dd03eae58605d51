// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "tensorir/core/core_visibility.hpp"

namespace tir {
/// \brief Static extents of a tensor, outermost axis first.
class Shape : public std::vector<size_t> {
public:
    using std::vector<size_t>::vector;

    Shape() = default;
    Shape(std::vector<size_t> axis_lengths) : std::vector<size_t>(std::move(axis_lengths)) {}

    TENSORIR_API std::string to_string() const;
};

TENSORIR_API
std::ostream& operator<<(std::ostream& s, const Shape& shape);
}  // namespace tir
