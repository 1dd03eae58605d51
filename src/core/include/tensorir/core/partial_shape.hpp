// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

#include "tensorir/core/core_visibility.hpp"
#include "tensorir/core/dimension.hpp"
#include "tensorir/core/rank.hpp"
#include "tensorir/core/shape.hpp"

namespace tir {

/// \brief Shape of a tensor whose rank, or some of whose dimensions, may be unknown.
///
/// A dynamic-rank shape carries no dimensions. A static-rank shape carries one Dimension per
/// axis, each of which may itself be dynamic:
///
/// \code{.cpp}
/// PartialShape s{2, 3, 4};                      // static
/// PartialShape s{Dimension::dynamic(), 3, 32};  // static rank, dynamic batch
/// PartialShape s = PartialShape::dynamic();     // dynamic rank
/// PartialShape s{"[?,3,1..10,32]"};
/// \endcode
class TENSORIR_API PartialShape {
    using Dimensions = std::vector<Dimension>;

public:
    using value_type = Dimensions::value_type;
    using iterator = Dimensions::iterator;
    using const_iterator = Dimensions::const_iterator;

    PartialShape(std::initializer_list<Dimension> init);
    PartialShape(std::vector<Dimension> dimensions);
    PartialShape(const std::vector<Dimension::value_type>& dimensions);
    PartialShape(const Shape& shape);

    /// \brief Parses "[d0,d1,...]" where each entry uses the Dimension syntax, or "[...]" for
    /// a dynamic rank.
    PartialShape(const std::string& shape);

    /// \brief Constructs the static shape of a scalar.
    PartialShape();

    /// \return `true` if the rank and every dimension are static.
    bool is_static() const;
    bool is_dynamic() const {
        return !is_static();
    }

    Rank rank() const {
        return m_rank_is_static ? Rank(static_cast<Dimension::value_type>(m_dimensions.size())) : Rank::dynamic();
    }

    /// \brief Shape of rank `r` with all dimensions dynamic, or of dynamic rank.
    static PartialShape dynamic(Rank r = Rank::dynamic());

    /// \throws tir::Exception If this shape is dynamic.
    Shape to_shape() const;

    /// \brief Index in `[-rank, rank)`, negative indices count from the back.
    const Dimension& operator[](std::ptrdiff_t i) const;
    Dimension& operator[](std::ptrdiff_t i);

    bool operator==(const PartialShape& partial_shape) const;
    bool operator!=(const PartialShape& partial_shape) const;

    std::string to_string() const;

    iterator begin() noexcept {
        return m_dimensions.begin();
    }
    const_iterator begin() const noexcept {
        return m_dimensions.cbegin();
    }
    iterator end() noexcept {
        return m_dimensions.end();
    }
    const_iterator end() const noexcept {
        return m_dimensions.cend();
    }
    /// \brief Number of dimensions, zero for a dynamic rank.
    size_t size() const {
        return m_dimensions.size();
    }

    friend TENSORIR_API std::ostream& operator<<(std::ostream& str, const PartialShape& shape);

private:
    PartialShape(bool rank_is_static, std::vector<Dimension> dimensions);

    bool m_rank_is_static{true};
    Dimensions m_dimensions;
};

TENSORIR_API
std::ostream& operator<<(std::ostream& str, const PartialShape& shape);

}  // namespace tir
