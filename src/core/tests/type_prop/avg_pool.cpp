// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/op/avg_pool.hpp"

#include <gtest/gtest.h>

#include "common_test_utils/type_prop.hpp"

using namespace std;
using namespace tir;
using namespace testing;

using AvgPoolV1Test = PoolingTypePropTest;

TEST_F(AvgPoolV1Test, avg_pool_default_ctor_values) {
    attrs.kernel = Shape{2, 2};
    const auto arg = make_input(PartialShape{1, 3, 32, 32});

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(avg_pool->get_output_size(), 1);
    EXPECT_EQ(avg_pool->get_output_element_type(0), element::f32);
    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 31, 31}));
    EXPECT_FALSE(avg_pool->get_exclude_pad().has_value());
    EXPECT_FALSE(avg_pool->get_resolved_exclude_pad());
    EXPECT_EQ(avg_pool->get_resolved_strides(), (Strides{1, 1}));
    EXPECT_EQ(avg_pool->get_resolved_pad_type(), op::PadType::VALID);
    EXPECT_FALSE(avg_pool->get_resolved_ceil_mode());
    EXPECT_EQ(avg_pool->get_target(), latest_target());
}

TEST_F(AvgPoolV1Test, avg_pool_exclude_pad_does_not_change_shape) {
    attrs.kernel = Shape{3, 3};
    attrs.pad_type = "custom";
    attrs.pads = CoordinateDiff{1, 1, 1, 1};
    const auto arg = make_input(PartialShape{2, 8, 16, 16}, element::f16);

    const auto include_pad = make_shared<op::v1::AvgPool>(arg, attrs, false);
    const auto exclude_pad = make_shared<op::v1::AvgPool>(arg, attrs, true);

    EXPECT_EQ(include_pad->get_output_partial_shape(0), (PartialShape{2, 8, 16, 16}));
    EXPECT_EQ(exclude_pad->get_output_partial_shape(0), include_pad->get_output_partial_shape(0));
    EXPECT_EQ(exclude_pad->get_output_element_type(0), element::f16);
    EXPECT_TRUE(exclude_pad->get_resolved_exclude_pad());
}

TEST_F(AvgPoolV1Test, avg_pool_valid_pad_strided) {
    attrs.kernel = Shape{3};
    attrs.strides = Strides{2};
    const auto arg = make_input(PartialShape{1, 3, 10});

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 4}));
    EXPECT_EQ(avg_pool->get_resolved_pads_begin(), (CoordinateDiff{0}));
    EXPECT_EQ(avg_pool->get_resolved_pads_end(), (CoordinateDiff{0}));
}

TEST_F(AvgPoolV1Test, avg_pool_same_upper_and_lower_pads) {
    attrs.kernel = Shape{2, 2};
    const auto arg = make_input(PartialShape{1, 3, 32, 32});

    attrs.pad_type = "same";
    const auto same_upper = make_shared<op::v1::AvgPool>(arg, attrs);
    attrs.pad_type = "same_lower";
    const auto same_lower = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(same_upper->get_output_partial_shape(0), (PartialShape{1, 3, 32, 32}));
    EXPECT_EQ(same_upper->get_resolved_pads_begin(), (CoordinateDiff{0, 0}));
    EXPECT_EQ(same_upper->get_resolved_pads_end(), (CoordinateDiff{1, 1}));
    EXPECT_EQ(same_lower->get_output_partial_shape(0), (PartialShape{1, 3, 32, 32}));
    EXPECT_EQ(same_lower->get_resolved_pads_begin(), (CoordinateDiff{1, 1}));
    EXPECT_EQ(same_lower->get_resolved_pads_end(), (CoordinateDiff{0, 0}));
}

TEST_F(AvgPoolV1Test, avg_pool_pad_type_is_case_insensitive) {
    attrs.kernel = Shape{3, 3};
    attrs.strides = Strides{2, 2};
    attrs.pad_type = "SAME";
    const auto arg = make_input(PartialShape{1, 3, 11, 10});

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(avg_pool->get_pad_type(), "SAME");
    EXPECT_EQ(avg_pool->get_resolved_pad_type(), op::PadType::SAME);
    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 6, 5}));
}

TEST_F(AvgPoolV1Test, avg_pool_unknown_pad_type) {
    attrs.kernel = Shape{2, 2};
    attrs.pad_type = "same_upper";
    const auto arg = make_input(PartialShape{1, 3, 32, 32});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("Unrecognized value of pad_type: 'same_upper'"));
}

TEST_F(AvgPoolV1Test, avg_pool_same_lower_requires_newer_target) {
    attrs.kernel = Shape{2, 2};
    attrs.pad_type = "same_lower";
    const auto arg = make_input(PartialShape{1, 3, 32, 32});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs, nullopt, TargetVersion::opset1),
                          NodeValidationFailure,
                          HasSubstr("pad_type 'same_lower' is not supported by target opset1"));

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs, nullopt, TargetVersion::opset2);
    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 32, 32}));
}

TEST_F(AvgPoolV1Test, avg_pool_ceil_mode_same_rejected) {
    attrs.kernel = Shape{2, 2};
    attrs.pad_type = "same";
    attrs.ceil_mode = true;
    const auto arg = make_input(PartialShape{1, 3, 32, 32});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("ceil_mode must be false when pad_type is 'same'"));
}

TEST_F(AvgPoolV1Test, avg_pool_ceil_mode_same_lower_accepted) {
    attrs.kernel = Shape{3, 3};
    attrs.strides = Strides{3, 3};
    attrs.pad_type = "same_lower";
    attrs.ceil_mode = true;
    const auto arg = make_input(PartialShape{1, 3, 10, 10});

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 4, 4}));
    EXPECT_TRUE(avg_pool->get_resolved_ceil_mode());
}

TEST_F(AvgPoolV1Test, avg_pool_ceil_mode_3d_rejected) {
    attrs.kernel = Shape{2, 2, 2};
    attrs.ceil_mode = true;
    const auto arg = make_input(PartialShape{1, 3, 8, 8, 8});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("ceil_mode is only supported for 1D or 2D pooling (got 3 spatial dimensions)"));
}

TEST_F(AvgPoolV1Test, avg_pool_ceil_mode_asymmetric_pads_rejected) {
    attrs.kernel = Shape{2, 2};
    attrs.strides = Strides{2, 2};
    attrs.pad_type = "custom";
    attrs.pads = CoordinateDiff{0, 1, 0, 0};
    attrs.ceil_mode = true;
    const auto arg = make_input(PartialShape{1, 3, 9, 9});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("Padding must be symmetric when ceil_mode is true"));
}

TEST_F(AvgPoolV1Test, avg_pool_ceil_mode_symmetric_pads) {
    attrs.kernel = Shape{2};
    attrs.strides = Strides{2};
    attrs.pad_type = "custom";
    attrs.pads = CoordinateDiff{1, 1};
    attrs.ceil_mode = true;
    const auto arg = make_input(PartialShape{1, 3, 5});

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 3}));
    EXPECT_EQ(avg_pool->get_resolved_pads_begin(), (CoordinateDiff{1}));
    EXPECT_EQ(avg_pool->get_resolved_pads_end(), (CoordinateDiff{1}));
}

TEST_F(AvgPoolV1Test, avg_pool_custom_without_pads_uses_zeros) {
    attrs.kernel = Shape{2, 2};
    attrs.pad_type = "custom";
    const auto arg = make_input(PartialShape{1, 3, 4, 6});

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 3, 5}));
    EXPECT_EQ(avg_pool->get_resolved_pads_begin(), (CoordinateDiff{0, 0}));
}

TEST_F(AvgPoolV1Test, avg_pool_pads_ignored_for_valid) {
    attrs.kernel = Shape{2, 2};
    attrs.pads = CoordinateDiff{1, 1, 1, 1};
    const auto arg = make_input(PartialShape{1, 3, 4, 6});

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 3, 5}));
    EXPECT_EQ(avg_pool->get_resolved_pads_begin(), (CoordinateDiff{0, 0}));
    EXPECT_EQ(avg_pool->get_resolved_pads_end(), (CoordinateDiff{0, 0}));
}

TEST_F(AvgPoolV1Test, avg_pool_dynamic_batch_and_channels) {
    attrs.kernel = Shape{2, 2};
    attrs.strides = Strides{2, 2};
    const auto arg = make_input(PartialShape{Dimension::dynamic(), Dimension::dynamic(), 8, 8});

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{Dimension::dynamic(), Dimension::dynamic(), 4, 4}));
}

TEST_F(AvgPoolV1Test, avg_pool_dynamic_spatial_dim) {
    attrs.kernel = Shape{2, 2};
    attrs.pad_type = "custom";
    attrs.pads = CoordinateDiff{1, 1, 0, 0};
    const auto arg = make_input(PartialShape{1, 3, Dimension::dynamic(), 8});

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, Dimension::dynamic(), 7}));
    EXPECT_EQ(avg_pool->get_resolved_pads_begin(), (CoordinateDiff{1, 0}));
    EXPECT_EQ(avg_pool->get_resolved_pads_end(), (CoordinateDiff{1, 0}));
}

TEST_F(AvgPoolV1Test, avg_pool_dynamic_rank_rejected) {
    attrs.kernel = Shape{2, 2};
    const auto arg = make_input(PartialShape::dynamic());

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("Input rank must be static"));
}

TEST_F(AvgPoolV1Test, avg_pool_invalid_rank) {
    attrs.kernel = Shape{2};
    const auto arg = make_input(PartialShape{3, 8});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("Input must have rank 3, 4 or 5"));
}

TEST_F(AvgPoolV1Test, avg_pool_integer_input_rejected) {
    attrs.kernel = Shape{2, 2};
    const auto arg = make_input(PartialShape{1, 3, 8, 8}, element::i32);

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("Input element type must be f16 or f32 (got i32)"));
}

TEST_F(AvgPoolV1Test, avg_pool_kernel_rank_mismatch) {
    attrs.kernel = Shape{2, 2, 2};
    const auto arg = make_input(PartialShape{1, 3, 8, 8});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("Kernel sizes ([2,2,2]) do not match the number of spatial dimensions (2)"));
}

TEST_F(AvgPoolV1Test, avg_pool_zero_kernel) {
    attrs.kernel = Shape{2, 0};
    const auto arg = make_input(PartialShape{1, 3, 8, 8});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("Kernel sizes must be positive"));
}

TEST_F(AvgPoolV1Test, avg_pool_zero_stride) {
    attrs.kernel = Shape{2, 2};
    attrs.strides = Strides{1, 0};
    const auto arg = make_input(PartialShape{1, 3, 8, 8});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("Strides must be positive"));
}

TEST_F(AvgPoolV1Test, avg_pool_wrong_pads_size) {
    attrs.kernel = Shape{2, 2};
    attrs.pad_type = "custom";
    attrs.pads = CoordinateDiff{1, 1};
    const auto arg = make_input(PartialShape{1, 3, 8, 8});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("must hold a before and after value for each of the 2 spatial dimensions"));
}

TEST_F(AvgPoolV1Test, avg_pool_negative_pads) {
    attrs.kernel = Shape{2, 2};
    attrs.pad_type = "custom";
    attrs.pads = CoordinateDiff{0, -1, 0, 0};
    const auto arg = make_input(PartialShape{1, 3, 8, 8});

    TENSORIR_EXPECT_THROW(std::ignore = make_shared<op::v1::AvgPool>(arg, attrs),
                          NodeValidationFailure,
                          HasSubstr("Pads must be non-negative"));
}

TEST_F(AvgPoolV1Test, avg_pool_kernel_larger_than_input) {
    attrs.kernel = Shape{5};
    const auto arg = make_input(PartialShape{1, 3, 2});

    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);

    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 0}));
}

TEST_F(AvgPoolV1Test, avg_pool_revalidate_after_setters) {
    attrs.kernel = Shape{2, 2};
    const auto arg = make_input(PartialShape{1, 3, 8, 8});
    const auto avg_pool = make_shared<op::v1::AvgPool>(arg, attrs);
    ASSERT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 7, 7}));

    avg_pool->set_strides(Strides{2, 2});
    avg_pool->set_exclude_pad(true);
    avg_pool->validate_and_infer_types();

    EXPECT_EQ(avg_pool->get_output_partial_shape(0), (PartialShape{1, 3, 4, 4}));
    EXPECT_TRUE(avg_pool->get_resolved_exclude_pad());

    avg_pool->set_pad_type("same_lower");
    avg_pool->set_target(TargetVersion::opset1);
    TENSORIR_EXPECT_THROW(avg_pool->validate_and_infer_types(),
                          NodeValidationFailure,
                          HasSubstr("not supported by target opset1"));
}

TEST_F(AvgPoolV1Test, avg_pool_clone_with_new_inputs) {
    attrs.kernel = Shape{3, 3};
    attrs.strides = Strides{2, 2};
    attrs.pad_type = "same_lower";
    const auto avg_pool = make_shared<op::v1::AvgPool>(make_input(PartialShape{1, 3, 9, 9}), attrs, true);

    const auto clone = avg_pool->clone_with_new_inputs({make_input(PartialShape{4, 16, 20, 20}, element::f16)});
    const auto cloned_pool = as_type_ptr<op::v1::AvgPool>(clone);

    ASSERT_NE(cloned_pool, nullptr);
    EXPECT_EQ(cloned_pool->get_kernel(), avg_pool->get_kernel());
    EXPECT_EQ(cloned_pool->get_pad_type(), "same_lower");
    EXPECT_EQ(cloned_pool->get_exclude_pad(), std::optional<bool>(true));
    EXPECT_EQ(cloned_pool->get_output_element_type(0), element::f16);
    EXPECT_EQ(cloned_pool->get_output_partial_shape(0), (PartialShape{4, 16, 10, 10}));

    TENSORIR_EXPECT_THROW(std::ignore = avg_pool->clone_with_new_inputs({}),
                          NodeValidationFailure,
                          HasSubstr("clone_with_new_inputs() expected 1 argument but got 0"));
}

TEST_F(AvgPoolV1Test, avg_pool_type_info) {
    attrs.kernel = Shape{2, 2};
    const shared_ptr<Node> avg_pool = make_shared<op::v1::AvgPool>(make_input(PartialShape{1, 3, 8, 8}), attrs);

    EXPECT_TRUE(is_type<op::v1::AvgPool>(avg_pool));
    EXPECT_TRUE(is_type<op::util::PoolingBase>(avg_pool));
    EXPECT_FALSE(is_type<op::v0::Parameter>(avg_pool));
    EXPECT_STREQ(avg_pool->get_type_info().name, "AvgPool");
    EXPECT_STREQ(avg_pool->get_type_info().version_id, "opset1");
    EXPECT_EQ(as_type_ptr<op::util::PoolingBase>(avg_pool)->get_kind(), op::util::PoolingKind::AVG);
}
