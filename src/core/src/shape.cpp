// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/shape.hpp"

#include <sstream>

#include "tensorir/util/common_util.hpp"

std::string tir::Shape::to_string() const {
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

std::ostream& tir::operator<<(std::ostream& s, const Shape& shape) {
    return s << "[" << tir::util::join(shape, ",") << "]";
}
