// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/op/max_pool.hpp"

#include <memory>

namespace tir {
namespace op {
namespace v1 {

MaxPool::MaxPool(const Output<Node>& arg, const pooling::Attributes& attributes, TargetVersion target)
    : util::PoolingBase(util::PoolingKind::MAX, arg, attributes, target) {
    constructor_validate_and_infer_types();
}

std::shared_ptr<Node> MaxPool::clone_with_new_inputs(const OutputVector& new_args) const {
    check_new_args_count(new_args, 1);
    return std::make_shared<MaxPool>(new_args.at(0), m_attributes, m_target);
}

}  // namespace v1
}  // namespace op
}  // namespace tir
