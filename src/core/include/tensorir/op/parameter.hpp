// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include "tensorir/op/op.hpp"

namespace tir {
namespace op {
namespace v0 {
/// \brief A graph parameter.
///
/// Parameters are nodes that represent the arguments that will be passed to
/// user-defined graphs. Function creation requires a sequence of parameters.
/// Basic graph operations do not need parameters attached to a graph.
/// \ingroup tir_ops_cpp_api
class TENSORIR_API Parameter : public op::Op {
public:
    TENSORIR_OP("Parameter", "opset1")
    /// \brief Constructions a tensor-typed parameter node.
    Parameter() = default;
    /// \brief Constructions a tensor-typed parameter node.
    ///
    /// \param element_type The element type of the parameter.
    /// \param pshape The partial shape of the parameter.
    Parameter(const tir::element::Type& element_type, const PartialShape& pshape);

    void validate_and_infer_types() override;

    std::shared_ptr<Node> clone_with_new_inputs(const OutputVector& new_args) const override;

    const PartialShape& get_partial_shape() const {
        return m_partial_shape;
    }
    void set_partial_shape(const PartialShape& partial_shape) {
        m_partial_shape = partial_shape;
    }
    const element::Type& get_element_type() const {
        return m_element_type;
    }
    void set_element_type(const element::Type& element_type) {
        m_element_type = element_type;
    }

protected:
    PartialShape m_partial_shape;
    element::Type m_element_type;
};
}  // namespace v0
}  // namespace op
}  // namespace tir
