// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <ostream>
#include <string>

#include "tensorir/core/core_visibility.hpp"
#include "tensorir/core/enum_names.hpp"

namespace tir {

/// \brief Operator set version a graph is compiled for. Ordered from earliest to latest.
enum class TargetVersion {
    opset1,
    opset2,
    opset3,
    opset4,
};

/// \brief Returns the earliest supported target.
constexpr TargetVersion earliest_target() {
    return TargetVersion::opset1;
}

/// \brief Returns the latest supported target.
constexpr TargetVersion latest_target() {
    return TargetVersion::opset4;
}

/// \brief Checks whether `target` is the earliest supported target.
constexpr bool is_earliest_target(TargetVersion target) {
    return target == earliest_target();
}

TENSORIR_API
std::ostream& operator<<(std::ostream& s, const TargetVersion& target);

template <>
TENSORIR_API EnumNames<TargetVersion>& EnumNames<TargetVersion>::get();

}  // namespace tir
