// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/coordinate_diff.hpp"

#include "tensorir/util/common_util.hpp"

std::ostream& tir::operator<<(std::ostream& s, const CoordinateDiff& coordinate_diff) {
    return s << "CoordinateDiff{" << tir::util::join(coordinate_diff) << "}";
}
