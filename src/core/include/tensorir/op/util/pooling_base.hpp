// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "tensorir/core/target.hpp"
#include "tensorir/core/validation_util.hpp"
#include "tensorir/op/op.hpp"
#include "tensorir/op/util/attr_types.hpp"

namespace tir {
namespace op {
namespace util {

/// \brief The closed set of pooling variants.
enum class PoolingKind {
    AVG,
    L2,
    MAX,
};

TENSORIR_API
std::ostream& operator<<(std::ostream& s, const PoolingKind& kind);

/// \brief Common state and shape inference of the pooling operations.
///
/// Holds the attributes as supplied by the builder, the target the graph is compiled for and
/// the parameters resolved by the last call to validate_and_infer_types(). Variant specific
/// rules are selected by the kind tag.
class TENSORIR_API PoolingBase : public Op {
public:
    TENSORIR_OP("Pooling", "util")

    void validate_and_infer_types() override;

    /// \return The pooling variant.
    PoolingKind get_kind() const {
        return m_kind;
    }

    /// \return The kernel shape.
    const Shape& get_kernel() const;
    void set_kernel(const Shape& kernel);

    /// \return The strides, empty if not supplied.
    const std::optional<Strides>& get_strides() const;
    void set_strides(const std::optional<Strides>& strides);

    /// \return The pad type exactly as supplied.
    const std::string& get_pad_type() const;
    void set_pad_type(const std::string& pad_type);

    /// \return The interleaved `[before, after]` pads, empty if not supplied.
    const std::optional<CoordinateDiff>& get_pads() const;
    void set_pads(const std::optional<CoordinateDiff>& pads);

    /// \return The ceil mode, empty if not supplied.
    const std::optional<bool>& get_ceil_mode() const;
    void set_ceil_mode(const std::optional<bool>& ceil_mode);

    /// \return The target the node is validated against.
    TargetVersion get_target() const;
    void set_target(TargetVersion target);

    /// \return The supplied attributes.
    const pooling::Attributes& get_attributes() const {
        return m_attributes;
    }

    /// Results of the last successful validate_and_infer_types().
    const Strides& get_resolved_strides() const {
        return m_resolved.strides;
    }
    bool get_resolved_ceil_mode() const {
        return m_resolved.ceil_mode;
    }
    PadType get_resolved_pad_type() const {
        return m_resolved_pad_type;
    }
    const CoordinateDiff& get_resolved_pads_begin() const {
        return m_resolved_pads_begin;
    }
    const CoordinateDiff& get_resolved_pads_end() const {
        return m_resolved_pads_end;
    }

protected:
    /// \brief Constructs a pooling operation.
    ///
    /// \param kind         The pooling variant.
    /// \param arg          The output producing the input data batch tensor.<br>
    ///                     `[N, C, D1, ... Dn]`, n in [1, 3]
    /// \param attributes   Kernel, strides, pad type, pads and ceil mode.
    /// \param target       The target the graph is compiled for.
    PoolingBase(PoolingKind kind,
                const Output<Node>& arg,
                const pooling::Attributes& attributes,
                TargetVersion target);

    PoolingKind m_kind{PoolingKind::MAX};
    pooling::Attributes m_attributes;
    TargetVersion m_target{latest_target()};

private:
    void validate_variant(size_t num_spatial) const;

    pooling::ResolvedParameters m_resolved;
    PadType m_resolved_pad_type{PadType::VALID};
    CoordinateDiff m_resolved_pads_begin;
    CoordinateDiff m_resolved_pads_end;
};
}  // namespace util
}  // namespace op

template <>
TENSORIR_API EnumNames<op::util::PoolingKind>& EnumNames<op::util::PoolingKind>::get();
}  // namespace tir
