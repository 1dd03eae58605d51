// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "tensorir/core/coordinate_diff.hpp"
#include "tensorir/core/node.hpp"
#include "tensorir/core/partial_shape.hpp"
#include "tensorir/core/shape.hpp"
#include "tensorir/core/strides.hpp"
#include "tensorir/core/target.hpp"
#include "tensorir/op/util/attr_types.hpp"

namespace tir {
namespace op {
namespace pooling {

/// \brief Pooling attributes as bound by the graph builder.
///
/// An empty optional means the attribute was not supplied, which is distinct from supplying
/// its default value.
struct Attributes {
    /// Window extent per spatial dimension.
    Shape kernel;
    /// Window step per spatial dimension. Defaults to all ones.
    std::optional<Strides> strides;
    /// One of "valid", "same", "custom", "same_lower", matched case-insensitively.
    std::string pad_type{"valid"};
    /// Interleaved `[before_0, after_0, before_1, after_1, ...]`. Used only by "custom".
    std::optional<CoordinateDiff> pads;
    /// Selects ceil rounding of the output extent. Defaults to false.
    std::optional<bool> ceil_mode;
};

/// \brief Attributes with every optional value filled in for a given spatial rank.
struct ResolvedParameters {
    Strides strides;
    CoordinateDiff pads;
    bool pads_given{false};
    bool ceil_mode{false};
};

/// \brief Fills unset attributes with their defaults for `num_spatial` spatial dimensions.
///
/// Strides default to ones, pads to zeros and ceil_mode to false. Supplied values are copied
/// unchanged. `attrs` is not modified.
TENSORIR_API ResolvedParameters resolve_defaults(const Attributes& attrs, size_t num_spatial);

/// \brief Checks that `pad_type` names a known padding mode, ignoring case.
TENSORIR_API bool is_valid_pad_type(const std::string& pad_type);

/// \brief Checks kernel, strides and pads have the lengths and signs required for
///        `num_spatial` spatial dimensions.
/// \throws NodeValidationFailure naming `node` on the first violation.
TENSORIR_API void validate_structure(const Node* node,
                                     const Attributes& attrs,
                                     const ResolvedParameters& resolved,
                                     size_t num_spatial);

/// \brief Runs the ordered legality checks on a resolved parameter set.
///
/// In order: pad type is known; ceil mode is limited to 1-D and 2-D pooling; ceil mode is not
/// combined with "same"; ceil mode with explicit pads requires symmetric pads; "same_lower"
/// is not available on the earliest target.
///
/// \return The parsed padding mode.
/// \throws NodeValidationFailure naming `node` on the first failing check.
TENSORIR_API PadType validate_parameters(const Node* node,
                                         const Attributes& attrs,
                                         const ResolvedParameters& resolved,
                                         size_t num_spatial,
                                         TargetVersion target);

/// \brief Computes the output extent of one spatial dimension.
///
/// \param in_extent     Input extent.
/// \param kernel        Window extent, positive.
/// \param stride        Window step, positive.
/// \param pad_type      Padding mode.
/// \param pad_before    [in,out] Padding before the data. Read for CUSTOM, written otherwise.
/// \param pad_after     [in,out] Padding after the data. Read for CUSTOM, written otherwise.
/// \param rounding_type Rounding of the window count. Ignored by SAME and SAME_LOWER.
///
/// \return The output extent. A kernel larger than the padded input gives a value <= 0.
TENSORIR_API int64_t infer_spatial_extent(int64_t in_extent,
                                          int64_t kernel,
                                          int64_t stride,
                                          PadType pad_type,
                                          int64_t& pad_before,
                                          int64_t& pad_after,
                                          RoundingType rounding_type);

/// \brief Computes the output shape of a pooling node.
///
/// Batch and channel dimensions are copied from `input_shape`. A dynamic spatial extent gives
/// a dynamic output extent. Degenerate extents are clamped to zero.
///
/// \param pads_begin [out] Resolved padding before each spatial dimension.
/// \param pads_end   [out] Resolved padding after each spatial dimension.
/// \throws NodeValidationFailure naming `node` if the input rank is dynamic or outside [3, 5].
TENSORIR_API PartialShape infer_output_shape(const Node* node,
                                             const PartialShape& input_shape,
                                             const Shape& kernel,
                                             const ResolvedParameters& resolved,
                                             PadType pad_type,
                                             CoordinateDiff& pads_begin,
                                             CoordinateDiff& pads_end);

}  // namespace pooling
}  // namespace op
}  // namespace tir
