// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include "tensorir/op/util/pooling_base.hpp"

namespace tir {
namespace op {
namespace v1 {
/// \brief Batched L2-norm pooling operation. Supports 1D and 2D pooling only.
/// \ingroup tir_ops_cpp_api
class TENSORIR_API L2Pool : public util::PoolingBase {
public:
    TENSORIR_OP("L2Pool", "opset1", util::PoolingBase)

    /// \brief Constructs a batched L2-norm pooling operation.
    ///
    /// \param arg         The node producing the input data batch tensor.
    /// \param attributes  Kernel, strides, pad type, pads and ceil mode.
    /// \param target      The target the graph is compiled for.
    L2Pool(const Output<Node>& arg, const pooling::Attributes& attributes, TargetVersion target = latest_target());

    std::shared_ptr<Node> clone_with_new_inputs(const OutputVector& new_args) const override;
};
}  // namespace v1
}  // namespace op
}  // namespace tir
