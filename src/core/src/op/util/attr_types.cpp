// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/op/util/attr_types.hpp"

namespace tir {

template <>
EnumNames<op::PadType>& EnumNames<op::PadType>::get() {
    static auto enum_names = EnumNames<op::PadType>("op::PadType",
                                                    {{"valid", op::PadType::VALID},
                                                     {"same", op::PadType::SAME},
                                                     {"custom", op::PadType::CUSTOM},
                                                     {"same_lower", op::PadType::SAME_LOWER}});
    return enum_names;
}

template <>
EnumNames<op::RoundingType>& EnumNames<op::RoundingType>::get() {
    static auto enum_names = EnumNames<op::RoundingType>(
        "op::RoundingType",
        {{"floor", op::RoundingType::FLOOR}, {"ceil", op::RoundingType::CEIL}});
    return enum_names;
}

std::ostream& op::operator<<(std::ostream& s, const op::PadType& type) {
    return s << as_string(type);
}

std::ostream& op::operator<<(std::ostream& s, const op::RoundingType& type) {
    return s << as_string(type);
}
}  // namespace tir
