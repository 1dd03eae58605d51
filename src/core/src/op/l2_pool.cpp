// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/op/l2_pool.hpp"

#include <memory>

namespace tir {
namespace op {
namespace v1 {

L2Pool::L2Pool(const Output<Node>& arg, const pooling::Attributes& attributes, TargetVersion target)
    : util::PoolingBase(util::PoolingKind::L2, arg, attributes, target) {
    constructor_validate_and_infer_types();
}

std::shared_ptr<Node> L2Pool::clone_with_new_inputs(const OutputVector& new_args) const {
    check_new_args_count(new_args, 1);
    return std::make_shared<L2Pool>(new_args.at(0), m_attributes, m_target);
}

}  // namespace v1
}  // namespace op
}  // namespace tir
