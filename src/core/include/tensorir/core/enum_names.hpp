// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "tensorir/core/except.hpp"

namespace tir {
/// \brief Name table for an enum class.
///
/// Each supported enum specializes get() in its source file and lists every member once.
template <typename EnumType>
class EnumNames {
public:
    using Entry = std::pair<std::string, EnumType>;

    static EnumType as_enum(const std::string& name) {
        const auto& table = get();
        const auto it = std::find_if(table.m_entries.begin(), table.m_entries.end(), [&name](const Entry& entry) {
            return entry.first == name;
        });
        TENSORIR_ASSERT(it != table.m_entries.end(), "\"", name, "\" is not a member of enum ", table.m_enum_name);
        return it->second;
    }

    static const std::string& as_string(EnumType value) {
        const auto& table = get();
        const auto it = std::find_if(table.m_entries.begin(), table.m_entries.end(), [value](const Entry& entry) {
            return entry.second == value;
        });
        TENSORIR_ASSERT(it != table.m_entries.end(),
                        "Value ",
                        static_cast<int64_t>(value),
                        " is not a member of enum ",
                        table.m_enum_name);
        return it->first;
    }

private:
    EnumNames(std::string enum_name, std::vector<Entry> entries)
        : m_enum_name(std::move(enum_name)),
          m_entries(std::move(entries)) {}

    static EnumNames<EnumType>& get();

    const std::string m_enum_name;
    const std::vector<Entry> m_entries;
};

template <typename Type, typename Value>
typename std::enable_if<std::is_convertible<Value, std::string>::value, Type>::type as_enum(const Value& value) {
    return EnumNames<Type>::as_enum(value);
}

template <typename Value>
const std::string& as_string(Value value) {
    return EnumNames<Value>::as_string(value);
}
}  // namespace tir
