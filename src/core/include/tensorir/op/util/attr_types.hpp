// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstddef>
#include <ostream>

#include "tensorir/core/core_visibility.hpp"
#include "tensorir/core/enum_names.hpp"

namespace tir {
namespace op {
/// \brief Padding Type used for `Pooling` operators.
enum class PadType {
    /// No padding. Windows must fit entirely inside the input.
    VALID = 0,
    /// Pads so that the output extent is ceil(input / stride); an odd remainder goes after.
    SAME,
    /// Pads by the explicitly supplied `[before, after]` amounts.
    CUSTOM,
    /// Like `SAME`, but an odd remainder goes before.
    SAME_LOWER,
};

/// \brief Rounding Type used for `Pooling` operators.
enum class RoundingType {
    FLOOR = 0,
    CEIL = 1,
};

TENSORIR_API
std::ostream& operator<<(std::ostream& s, const PadType& type);

TENSORIR_API
std::ostream& operator<<(std::ostream& s, const RoundingType& type);
}  // namespace op

template <>
TENSORIR_API EnumNames<op::PadType>& EnumNames<op::PadType>::get();

template <>
TENSORIR_API EnumNames<op::RoundingType>& EnumNames<op::RoundingType>::get();
}  // namespace tir
