// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/op/util/pooling_base.hpp"

#include <utility>

#include "tensorir/core/validation_util.hpp"

namespace tir {

template <>
EnumNames<op::util::PoolingKind>& EnumNames<op::util::PoolingKind>::get() {
    static auto enum_names = EnumNames<op::util::PoolingKind>("op::util::PoolingKind",
                                                              {{"avg", op::util::PoolingKind::AVG},
                                                               {"l2", op::util::PoolingKind::L2},
                                                               {"max", op::util::PoolingKind::MAX}});
    return enum_names;
}

namespace op {
namespace util {

std::ostream& operator<<(std::ostream& s, const PoolingKind& kind) {
    return s << as_string(kind);
}

PoolingBase::PoolingBase(PoolingKind kind,
                         const Output<Node>& arg,
                         const pooling::Attributes& attributes,
                         TargetVersion target)
    : Op({arg}),
      m_kind(kind),
      m_attributes(attributes),
      m_target(target) {}

void PoolingBase::validate_and_infer_types() {
    NODE_VALIDATION_CHECK(this, get_input_size() == 1, "Expected exactly one input, got ", get_input_size(), ".");

    const auto& element_type = get_input_element_type(0);
    NODE_VALIDATION_CHECK(this,
                          element_type == element::f16 || element_type == element::f32,
                          "Input element type must be f16 or f32 (got ",
                          element_type,
                          ").");

    const auto& input_shape = get_input_partial_shape(0);
    const auto rank = input_shape.rank();
    NODE_VALIDATION_CHECK(this,
                          rank.is_static(),
                          "Input rank must be static to resolve pooling attributes (input shape: ",
                          input_shape,
                          ").");
    NODE_VALIDATION_CHECK(this,
                          rank.get_length() >= 3 && rank.get_length() <= 5,
                          "Input must have rank 3, 4 or 5 (input shape: ",
                          input_shape,
                          ").");
    const auto num_spatial = static_cast<size_t>(rank.get_length() - 2);

    validate_variant(num_spatial);

    auto resolved = pooling::resolve_defaults(m_attributes, num_spatial);
    pooling::validate_structure(this, m_attributes, resolved, num_spatial);
    const auto pad_type = pooling::validate_parameters(this, m_attributes, resolved, num_spatial, m_target);

    CoordinateDiff pads_begin, pads_end;
    const auto output_shape =
        pooling::infer_output_shape(this, input_shape, m_attributes.kernel, resolved, pad_type, pads_begin, pads_end);

    m_resolved = std::move(resolved);
    m_resolved_pad_type = pad_type;
    m_resolved_pads_begin = std::move(pads_begin);
    m_resolved_pads_end = std::move(pads_end);
    set_output_type(0, element_type, output_shape);
}

void PoolingBase::validate_variant(size_t num_spatial) const {
    switch (m_kind) {
    case PoolingKind::AVG:
    case PoolingKind::MAX:
        break;
    case PoolingKind::L2:
        NODE_VALIDATION_CHECK(this,
                              num_spatial <= 2,
                              "L2 pooling supports only 1D or 2D pooling (got ",
                              num_spatial,
                              " spatial dimensions).");
        break;
    }
}

const Shape& PoolingBase::get_kernel() const {
    return m_attributes.kernel;
}

void PoolingBase::set_kernel(const Shape& kernel) {
    m_attributes.kernel = kernel;
}

const std::optional<Strides>& PoolingBase::get_strides() const {
    return m_attributes.strides;
}

void PoolingBase::set_strides(const std::optional<Strides>& strides) {
    m_attributes.strides = strides;
}

const std::string& PoolingBase::get_pad_type() const {
    return m_attributes.pad_type;
}

void PoolingBase::set_pad_type(const std::string& pad_type) {
    m_attributes.pad_type = pad_type;
}

const std::optional<CoordinateDiff>& PoolingBase::get_pads() const {
    return m_attributes.pads;
}

void PoolingBase::set_pads(const std::optional<CoordinateDiff>& pads) {
    m_attributes.pads = pads;
}

const std::optional<bool>& PoolingBase::get_ceil_mode() const {
    return m_attributes.ceil_mode;
}

void PoolingBase::set_ceil_mode(const std::optional<bool>& ceil_mode) {
    m_attributes.ceil_mode = ceil_mode;
}

TargetVersion PoolingBase::get_target() const {
    return m_target;
}

void PoolingBase::set_target(TargetVersion target) {
    m_target = target;
}

}  // namespace util
}  // namespace op
}  // namespace tir
