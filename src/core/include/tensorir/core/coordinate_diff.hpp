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
/// \brief Signed per-axis offsets. Pooling keeps its pads in this form.
class CoordinateDiff : public std::vector<std::ptrdiff_t> {
public:
    using std::vector<std::ptrdiff_t>::vector;

    CoordinateDiff() = default;
    CoordinateDiff(std::vector<std::ptrdiff_t> diffs) : std::vector<std::ptrdiff_t>(std::move(diffs)) {}
};

TENSORIR_API
std::ostream& operator<<(std::ostream& s, const CoordinateDiff& coordinate_diff);
}  // namespace tir
