// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/op/parameter.hpp"

#include <memory>

namespace tir {
namespace op {
namespace v0 {

Parameter::Parameter(const element::Type& element_type, const PartialShape& pshape)
    : m_partial_shape(pshape),
      m_element_type(element_type) {
    constructor_validate_and_infer_types();
}

void Parameter::validate_and_infer_types() {
    Op::validate_and_infer_types();
    set_output_type(0, m_element_type, m_partial_shape);
}

std::shared_ptr<Node> Parameter::clone_with_new_inputs(const OutputVector& new_args) const {
    check_new_args_count(new_args, 0);
    auto new_param = std::make_shared<Parameter>(m_element_type, m_partial_shape);
    new_param->set_friendly_name(get_friendly_name());
    return new_param;
}

}  // namespace v0
}  // namespace op
}  // namespace tir
