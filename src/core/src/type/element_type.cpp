// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/type/element_type.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <string_view>

#include "tensorir/core/except.hpp"

namespace tir {
namespace element {
namespace {
struct TypeInfo {
    size_t m_bitwidth;
    bool m_is_real;
    bool m_is_signed;
    std::string_view m_cname;
    std::string_view m_type_name;
    std::string_view m_legacy_name;
};

constexpr std::array<TypeInfo, 8> types_info{{
    {0, false, false, "dynamic", "dynamic", "UNSPECIFIED"},
    {8, false, true, "char", "boolean", "BOOL"},
    {16, true, true, "float16", "f16", "FP16"},
    {32, true, true, "float", "f32", "FP32"},
    {64, true, true, "double", "f64", "FP64"},
    {32, false, true, "int32_t", "i32", "I32"},
    {64, false, true, "int64_t", "i64", "I64"},
    {8, false, false, "uint8_t", "u8", "U8"},
}};

const TypeInfo& get_type_info(Type_t type) {
    const auto idx = static_cast<size_t>(type);
    TENSORIR_ASSERT(idx < types_info.size(), "Type_t not supported: ", idx);
    return types_info[idx];
}

Type_t type_from_string(const std::string& type) {
    const auto it = std::find_if(types_info.begin(), types_info.end(), [&type](const TypeInfo& info) {
        return info.m_type_name == type || info.m_legacy_name == type;
    });
    TENSORIR_ASSERT(it != types_info.end(), "Unsupported element type: ", type);
    return static_cast<Type_t>(std::distance(types_info.begin(), it));
}
}  // namespace

Type::Type(const std::string& type) : Type(type_from_string(type)) {}

std::string Type::c_type_string() const {
    return std::string(get_type_info(m_type).m_cname);
}

size_t Type::size() const {
    return (bitwidth() + 7) >> 3;
}

Type Type::from_string(const std::string& type) {
    return Type(type);
}

bool Type::is_static() const {
    return get_type_info(m_type).m_bitwidth != 0;
}

bool Type::is_real() const {
    return get_type_info(m_type).m_is_real;
}

bool Type::is_integral_number() const {
    return is_integral() && (m_type != Type_t::boolean);
}

bool Type::is_signed() const {
    return get_type_info(m_type).m_is_signed;
}

size_t Type::bitwidth() const {
    return get_type_info(m_type).m_bitwidth;
}

std::string Type::get_type_name_string() const {
    return std::string(get_type_info(m_type).m_type_name);
}

bool Type::operator==(const Type& other) const {
    return m_type == other.m_type;
}

bool Type::operator<(const Type& other) const {
    return m_type < other.m_type;
}

std::ostream& operator<<(std::ostream& out, const Type& obj) {
    return out << obj.get_type_name_string();
}

std::istream& operator>>(std::istream& in, Type& obj) {
    std::string str;
    in >> str;
    obj = Type(str);
    return in;
}
}  // namespace element
}  // namespace tir
