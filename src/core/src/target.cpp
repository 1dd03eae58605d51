// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/target.hpp"

namespace tir {

template <>
EnumNames<TargetVersion>& EnumNames<TargetVersion>::get() {
    static auto enum_names = EnumNames<TargetVersion>("tir::TargetVersion",
                                                      {{"opset1", TargetVersion::opset1},
                                                       {"opset2", TargetVersion::opset2},
                                                       {"opset3", TargetVersion::opset3},
                                                       {"opset4", TargetVersion::opset4}});
    return enum_names;
}

std::ostream& operator<<(std::ostream& s, const TargetVersion& target) {
    return s << as_string(target);
}
}  // namespace tir
