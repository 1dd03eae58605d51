// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <memory>
#include <string>

#include "common_test_utils/test_assertions.hpp"
#include "gmock/gmock.h"
#include "tensorir/core/partial_shape.hpp"
#include "tensorir/core/validation_util.hpp"
#include "tensorir/op/parameter.hpp"

#define EXPECT_HAS_SUBSTRING(haystack, needle) EXPECT_PRED_FORMAT2(testing::IsSubstring, needle, haystack)

/// \brief Test fixture for pooling type_prop tests. Holds the input parameter and the
/// attributes the operation is built with.
class PoolingTypePropTest : public testing::Test {
protected:
    std::shared_ptr<tir::op::v0::Parameter> make_input(const tir::PartialShape& shape,
                                                       const tir::element::Type& type = tir::element::f32) {
        return std::make_shared<tir::op::v0::Parameter>(type, shape);
    }

    tir::op::pooling::Attributes attrs;
};
