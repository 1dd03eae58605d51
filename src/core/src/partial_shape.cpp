// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/partial_shape.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "tensorir/core/except.hpp"
#include "tensorir/util/common_util.hpp"

namespace tir {
namespace {
size_t normalize_index(std::ptrdiff_t idx, size_t rank) {
    const auto r = static_cast<std::ptrdiff_t>(rank);
    TENSORIR_ASSERT(idx >= -r && idx < r, "Accessing out-of-range dimension: ", idx, " for rank ", rank);
    return static_cast<size_t>(idx < 0 ? idx + r : idx);
}
}  // namespace

PartialShape::PartialShape() = default;

PartialShape::PartialShape(std::initializer_list<Dimension> init) : m_dimensions(init) {}

PartialShape::PartialShape(std::vector<Dimension> dimensions) : m_dimensions(std::move(dimensions)) {}

PartialShape::PartialShape(const std::vector<Dimension::value_type>& dimensions)
    : m_dimensions(dimensions.begin(), dimensions.end()) {}

PartialShape::PartialShape(const Shape& shape) {
    m_dimensions.reserve(shape.size());
    for (const auto length : shape)
        m_dimensions.emplace_back(static_cast<Dimension::value_type>(length));
}

PartialShape::PartialShape(const std::string& shape) {
    auto text = util::trim(shape);
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']')
        text = util::trim(text.substr(1, text.size() - 2));

    if (text == "...") {
        m_rank_is_static = false;
        return;
    }
    if (text.empty())
        return;

    std::istringstream fields(text);
    std::string field;
    while (std::getline(fields, field, ',')) {
        TENSORIR_ASSERT(!util::trim(field).empty(), "Cannot parse shape \"", shape, "\": empty dimension");
        m_dimensions.emplace_back(field);
    }
}

PartialShape::PartialShape(bool rank_is_static, std::vector<Dimension> dimensions)
    : m_rank_is_static(rank_is_static),
      m_dimensions(std::move(dimensions)) {}

PartialShape PartialShape::dynamic(Rank r) {
    if (r.is_dynamic())
        return PartialShape(false, {});
    return PartialShape(true, std::vector<Dimension>(static_cast<size_t>(r.get_length()), Dimension::dynamic()));
}

bool PartialShape::is_static() const {
    return m_rank_is_static && std::all_of(m_dimensions.begin(), m_dimensions.end(), [](const Dimension& d) {
               return d.is_static();
           });
}

Shape PartialShape::to_shape() const {
    if (is_dynamic()) {
        TENSORIR_THROW("to_shape was called on a dynamic shape.");
    }
    Shape shape;
    shape.reserve(m_dimensions.size());
    for (const auto& d : m_dimensions)
        shape.push_back(static_cast<size_t>(d.get_length()));
    return shape;
}

const Dimension& PartialShape::operator[](std::ptrdiff_t i) const {
    return m_dimensions[normalize_index(i, m_dimensions.size())];
}

Dimension& PartialShape::operator[](std::ptrdiff_t i) {
    return m_dimensions[normalize_index(i, m_dimensions.size())];
}

bool PartialShape::operator==(const PartialShape& partial_shape) const {
    return m_rank_is_static == partial_shape.m_rank_is_static && m_dimensions == partial_shape.m_dimensions;
}

bool PartialShape::operator!=(const PartialShape& partial_shape) const {
    return !(*this == partial_shape);
}

std::string PartialShape::to_string() const {
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

std::ostream& operator<<(std::ostream& str, const PartialShape& shape) {
    if (!shape.m_rank_is_static)
        return str << "[...]";
    return str << "[" << util::join(shape.m_dimensions, ",") << "]";
}

}  // namespace tir
