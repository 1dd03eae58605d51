// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/op/avg_pool.hpp"

#include <memory>

namespace tir {
namespace op {
namespace v1 {

AvgPool::AvgPool(const Output<Node>& arg,
                 const pooling::Attributes& attributes,
                 std::optional<bool> exclude_pad,
                 TargetVersion target)
    : util::PoolingBase(util::PoolingKind::AVG, arg, attributes, target),
      m_exclude_pad(exclude_pad) {
    constructor_validate_and_infer_types();
}

std::shared_ptr<Node> AvgPool::clone_with_new_inputs(const OutputVector& new_args) const {
    check_new_args_count(new_args, 1);
    return std::make_shared<AvgPool>(new_args.at(0), m_attributes, m_exclude_pad, m_target);
}

const std::optional<bool>& AvgPool::get_exclude_pad() const {
    return m_exclude_pad;
}

void AvgPool::set_exclude_pad(const std::optional<bool>& exclude_pad) {
    m_exclude_pad = exclude_pad;
}

}  // namespace v1
}  // namespace op
}  // namespace tir
