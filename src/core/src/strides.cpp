// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/strides.hpp"

#include "tensorir/util/common_util.hpp"

std::ostream& tir::operator<<(std::ostream& s, const Strides& strides) {
    return s << "Strides{" << tir::util::join(strides) << "}";
}
