// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/type.hpp"

#include <string_view>
#include <tuple>

namespace tir {
namespace {
// A missing version id compares equal to an empty one.
std::tuple<std::string_view, std::string_view> type_key(const DiscreteTypeInfo& info) {
    return {info.name ? info.name : "", info.version_id ? info.version_id : ""};
}
}  // namespace

bool DiscreteTypeInfo::is_castable(const DiscreteTypeInfo& target_type) const {
    for (auto info = this; info; info = info->parent) {
        if (*info == target_type)
            return true;
    }
    return false;
}

std::string DiscreteTypeInfo::get_version() const {
    return version_id ? std::string(version_id) : std::string{};
}

DiscreteTypeInfo::operator std::string() const {
    return std::string(name) + "_" + get_version();
}

bool DiscreteTypeInfo::operator<(const DiscreteTypeInfo& b) const {
    return type_key(*this) < type_key(b);
}

bool DiscreteTypeInfo::operator==(const DiscreteTypeInfo& b) const {
    return type_key(*this) == type_key(b);
}

bool DiscreteTypeInfo::operator!=(const DiscreteTypeInfo& b) const {
    return !(*this == b);
}

std::ostream& operator<<(std::ostream& s, const DiscreteTypeInfo& info) {
    s << "DiscreteTypeInfo{name: " << info.name << ", version_id: " << (info.version_id ? info.version_id : "(empty)")
      << ", parent: ";
    if (info.parent)
        s << *info.parent;
    else
        s << "null";
    return s << "}";
}
}  // namespace tir
