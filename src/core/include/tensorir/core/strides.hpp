// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstddef>
#include <ostream>
#include <utility>
#include <vector>

#include "tensorir/core/core_visibility.hpp"

namespace tir {
/// \brief Window step per spatial axis.
class Strides : public std::vector<size_t> {
public:
    using std::vector<size_t>::vector;

    Strides() = default;
    Strides(std::vector<size_t> axis_strides) : std::vector<size_t>(std::move(axis_strides)) {}
};

TENSORIR_API
std::ostream& operator<<(std::ostream& s, const Strides& strides);
}  // namespace tir
