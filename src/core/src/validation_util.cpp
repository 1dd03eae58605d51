// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/validation_util.hpp"

#include <algorithm>

#include "tensorir/util/common_util.hpp"
#include "tensorir/util/log.hpp"

namespace tir {
namespace op {
namespace pooling {
namespace {
std::string node_name(const Node* node) {
    return node ? node->get_friendly_name() : std::string("<detached>");
}
}  // namespace

ResolvedParameters resolve_defaults(const Attributes& attrs, size_t num_spatial) {
    ResolvedParameters resolved;
    resolved.strides = attrs.strides.value_or(Strides(num_spatial, 1));
    resolved.pads_given = attrs.pads.has_value();
    resolved.pads = attrs.pads.value_or(CoordinateDiff(2 * num_spatial, 0));
    resolved.ceil_mode = attrs.ceil_mode.value_or(false);
    return resolved;
}

bool is_valid_pad_type(const std::string& pad_type) {
    const auto name = tir::util::to_lower(pad_type);
    return name == "valid" || name == "same" || name == "custom" || name == "same_lower";
}

void validate_structure(const Node* node,
                        const Attributes& attrs,
                        const ResolvedParameters& resolved,
                        size_t num_spatial) {
    NODE_VALIDATION_CHECK(node,
                          attrs.kernel.size() == num_spatial,
                          "Kernel sizes (",
                          attrs.kernel,
                          ") do not match the number of spatial dimensions (",
                          num_spatial,
                          ").");
    NODE_VALIDATION_CHECK(node,
                          std::all_of(attrs.kernel.begin(),
                                      attrs.kernel.end(),
                                      [](size_t k) {
                                          return k > 0;
                                      }),
                          "Kernel sizes must be positive (kernel sizes: ",
                          attrs.kernel,
                          ").");

    NODE_VALIDATION_CHECK(node,
                          resolved.strides.size() == num_spatial,
                          "Strides (",
                          resolved.strides,
                          ") do not match the number of spatial dimensions (",
                          num_spatial,
                          ").");
    NODE_VALIDATION_CHECK(node,
                          std::all_of(resolved.strides.begin(),
                                      resolved.strides.end(),
                                      [](size_t s) {
                                          return s > 0;
                                      }),
                          "Strides must be positive (strides: ",
                          resolved.strides,
                          ").");

    NODE_VALIDATION_CHECK(node,
                          resolved.pads.size() == 2 * num_spatial,
                          "Pads (",
                          resolved.pads,
                          ") must hold a before and after value for each of the ",
                          num_spatial,
                          " spatial dimensions.");
    NODE_VALIDATION_CHECK(node,
                          std::all_of(resolved.pads.begin(),
                                      resolved.pads.end(),
                                      [](std::ptrdiff_t p) {
                                          return p >= 0;
                                      }),
                          "Pads must be non-negative (pads: ",
                          resolved.pads,
                          ").");
}

PadType validate_parameters(const Node* node,
                            const Attributes& attrs,
                            const ResolvedParameters& resolved,
                            size_t num_spatial,
                            TargetVersion target) {
    NODE_VALIDATION_CHECK(node,
                          is_valid_pad_type(attrs.pad_type),
                          "Unrecognized value of pad_type: '",
                          attrs.pad_type,
                          "'. Expected one of: valid, same, custom, same_lower.");
    const auto pad_type = as_enum<PadType>(tir::util::to_lower(attrs.pad_type));

    if (resolved.ceil_mode) {
        NODE_VALIDATION_CHECK(node,
                              num_spatial <= 2,
                              "ceil_mode is only supported for 1D or 2D pooling (got ",
                              num_spatial,
                              " spatial dimensions).");
        NODE_VALIDATION_CHECK(node, pad_type != PadType::SAME, "ceil_mode must be false when pad_type is 'same'.");
        if (resolved.pads_given) {
            for (size_t i = 0; i < num_spatial; ++i) {
                NODE_VALIDATION_CHECK(node,
                                      resolved.pads[2 * i] == resolved.pads[2 * i + 1],
                                      "Padding must be symmetric when ceil_mode is true (pads: ",
                                      resolved.pads,
                                      ", spatial dimension ",
                                      i,
                                      ").");
            }
        }
    }

    NODE_VALIDATION_CHECK(node,
                          !(is_earliest_target(target) && pad_type == PadType::SAME_LOWER),
                          "pad_type 'same_lower' is not supported by target ",
                          target,
                          ".");

    if (resolved.pads_given && pad_type != PadType::CUSTOM) {
        TENSORIR_WARN << "Pads " << resolved.pads << " are ignored for pad_type '" << pad_type << "' on "
                      << node_name(node);
    }
    return pad_type;
}

int64_t infer_spatial_extent(int64_t in_extent,
                             int64_t kernel,
                             int64_t stride,
                             PadType pad_type,
                             int64_t& pad_before,
                             int64_t& pad_after,
                             RoundingType rounding_type) {
    switch (pad_type) {
    case PadType::VALID:
        pad_before = 0;
        pad_after = 0;
        break;
    case PadType::CUSTOM:
        break;
    case PadType::SAME:
    case PadType::SAME_LOWER: {
        const auto out_extent = tir::util::ceil_div(in_extent, stride);
        const auto total = std::max<int64_t>(0, (out_extent - 1) * stride + kernel - in_extent);
        const auto half = total / 2;
        pad_before = pad_type == PadType::SAME ? half : total - half;
        pad_after = total - pad_before;
        return tir::util::floor_div(in_extent + total - kernel, stride) + 1;
    }
    }

    const auto total = pad_before + pad_after;
    const auto span = in_extent + total - kernel;
    if (rounding_type == RoundingType::CEIL) {
        auto out_extent = tir::util::ceil_div(span, stride) + 1;
        // The last window must start inside the data or the leading padding.
        if ((out_extent - 1) * stride >= in_extent + pad_before && total > 0) {
            --out_extent;
        }
        return out_extent;
    }
    return tir::util::floor_div(span, stride) + 1;
}

PartialShape infer_output_shape(const Node* node,
                                const PartialShape& input_shape,
                                const Shape& kernel,
                                const ResolvedParameters& resolved,
                                PadType pad_type,
                                CoordinateDiff& pads_begin,
                                CoordinateDiff& pads_end) {
    const auto& rank = input_shape.rank();
    NODE_VALIDATION_CHECK(node, rank.is_static(), "Input rank must be static (input shape: ", input_shape, ").");
    NODE_VALIDATION_CHECK(node,
                          rank.get_length() >= 3 && rank.get_length() <= 5,
                          "Input must have rank 3, 4 or 5 (one batch axis, one channel axis and one to three ",
                          "spatial axes) (input shape: ",
                          input_shape,
                          ").");

    const auto num_spatial = static_cast<size_t>(rank.get_length() - 2);
    NODE_VALIDATION_CHECK(node,
                          kernel.size() == num_spatial && resolved.strides.size() == num_spatial &&
                              resolved.pads.size() == 2 * num_spatial,
                          "Ranks for input spatial shape (input has shape ",
                          input_shape,
                          "), kernel (",
                          kernel,
                          "), strides (",
                          resolved.strides,
                          ") and pads (",
                          resolved.pads,
                          ") do not match.");

    const auto rounding_type = resolved.ceil_mode ? RoundingType::CEIL : RoundingType::FLOOR;
    PartialShape output_shape{input_shape};
    pads_begin = CoordinateDiff(num_spatial, 0);
    pads_end = CoordinateDiff(num_spatial, 0);

    for (size_t i = 0; i < num_spatial; ++i) {
        const auto axis = static_cast<std::ptrdiff_t>(i + 2);
        int64_t before = pad_type == PadType::CUSTOM ? resolved.pads[2 * i] : 0;
        int64_t after = pad_type == PadType::CUSTOM ? resolved.pads[2 * i + 1] : 0;

        const auto& in_dim = input_shape[axis];
        if (in_dim.is_dynamic()) {
            output_shape[axis] = Dimension::dynamic();
        } else {
            auto extent = infer_spatial_extent(in_dim.get_length(),
                                               static_cast<int64_t>(kernel[i]),
                                               static_cast<int64_t>(resolved.strides[i]),
                                               pad_type,
                                               before,
                                               after,
                                               rounding_type);
            if (extent <= 0) {
                TENSORIR_WARN << "Pooling window does not fit spatial dimension " << i << " of " << input_shape
                              << " (kernel " << kernel[i] << ", pads " << before << "/" << after
                              << "); output extent " << extent << " is clamped to 0 on " << node_name(node);
                extent = 0;
            }
            output_shape[axis] = Dimension(extent);
        }
        pads_begin[i] = before;
        pads_end[i] = after;
    }

    TENSORIR_DEBUG << node_name(node) << ": input " << input_shape << " -> output " << output_shape
                   << ", pads_begin " << pads_begin << ", pads_end " << pads_end;
    return output_shape;
}

}  // namespace pooling
}  // namespace op
}  // namespace tir
