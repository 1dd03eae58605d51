// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include "tensorir/core/node.hpp"

/// Declares the runtime type information of an operation class.
/// \param TYPE_NAME Name of the operation, e.g. "AvgPool"
/// \param VERSION_NAME Operator set the operation belongs to, e.g. "opset1"
/// \param PARENT_CLASS Base class of the operation; defaults to ::tir::op::Op
#define _TENSORIR_OP_2(TYPE_NAME, VERSION_NAME)   TENSORIR_RTTI(TYPE_NAME, VERSION_NAME, ::tir::op::Op)
#define _TENSORIR_OP_3(TYPE_NAME, VERSION_NAME, PARENT_CLASS) TENSORIR_RTTI(TYPE_NAME, VERSION_NAME, PARENT_CLASS)
#define _TENSORIR_OP_SELECT(_1, _2, _3, NAME, ...) NAME
#define TENSORIR_OP(...) \
    _TENSORIR_RTTI_EXPAND(_TENSORIR_OP_SELECT(__VA_ARGS__, _TENSORIR_OP_3, _TENSORIR_OP_2, unused)(__VA_ARGS__))

namespace tir {
namespace op {
/// Root of all actual ops
class TENSORIR_API Op : public Node {
public:
    TENSORIR_RTTI("Op", "", ::tir::Node)

protected:
    Op() : Node() {}
    Op(const OutputVector& arguments);
};
}  // namespace op
}  // namespace tir
