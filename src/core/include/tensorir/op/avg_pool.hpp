// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <optional>

#include "tensorir/op/util/pooling_base.hpp"

namespace tir {
namespace op {
namespace v1 {
/// \brief Batched average pooling operation.
/// \ingroup tir_ops_cpp_api
class TENSORIR_API AvgPool : public util::PoolingBase {
public:
    TENSORIR_OP("AvgPool", "opset1", util::PoolingBase)

    /// \brief      Constructs a batched average pooling operation.
    ///
    /// \param      arg            The output producing the input data batch tensor.<br>
    ///                            `[N, C, D1, ... Dn]`
    /// \param      attributes     Kernel, strides, pad type, pads and ceil mode.
    /// \param      exclude_pad    If false then averages include padding elements, each
    ///                            treated as the number zero. If true, padding elements
    ///                            are entirely ignored when computing averages.
    ///                            Does not affect the output shape. Defaults to false.
    /// \param      target         The target the graph is compiled for.
    AvgPool(const Output<Node>& arg,
            const pooling::Attributes& attributes,
            std::optional<bool> exclude_pad = std::nullopt,
            TargetVersion target = latest_target());

    std::shared_ptr<Node> clone_with_new_inputs(const OutputVector& new_args) const override;

    /// \return Exclude zero-values in padding area, empty if not supplied.
    const std::optional<bool>& get_exclude_pad() const;
    void set_exclude_pad(const std::optional<bool>& exclude_pad);

    /// \return Exclude zero-values in padding area with the default applied.
    bool get_resolved_exclude_pad() const {
        return m_exclude_pad.value_or(false);
    }

private:
    std::optional<bool> m_exclude_pad;
};
}  // namespace v1
}  // namespace op
}  // namespace tir
