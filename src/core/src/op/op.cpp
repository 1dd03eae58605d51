// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/op/op.hpp"

tir::op::Op::Op(const tir::OutputVector& args) : Node(args) {}
