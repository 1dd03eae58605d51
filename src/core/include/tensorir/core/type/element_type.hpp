// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

//================================================================================================
// ElementType
//================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "tensorir/core/core_visibility.hpp"

namespace tir {
namespace element {
/// \brief Enum to define possible element types
enum class Type_t {
    dynamic,  //!< Dynamic element type
    boolean,  //!< boolean element type
    f16,      //!< f16 element type
    f32,      //!< f32 element type
    f64,      //!< f64 element type
    i32,      //!< i32 element type
    i64,      //!< i64 element type
    u8,       //!< u8 element type
};

/// \brief Base class to define element type
class TENSORIR_API Type {
public:
    constexpr Type() = default;
    constexpr Type(const Type_t t) : m_type{t} {}
    explicit Type(const std::string& type);

    Type(const Type&) = default;
    Type& operator=(const Type&) = default;

    std::string c_type_string() const;
    size_t size() const;
    constexpr Type_t get_type_name() const {
        return m_type;
    }
    static Type from_string(const std::string& type);
    bool is_static() const;
    bool is_dynamic() const {
        return m_type == Type_t::dynamic;
    }
    bool is_real() const;
    bool is_integral() const {
        return !is_real();
    }
    bool is_integral_number() const;
    bool is_signed() const;
    size_t bitwidth() const;
    // The name of this type, the enum name of this type
    std::string get_type_name_string() const;
    friend TENSORIR_API std::ostream& operator<<(std::ostream&, const Type&);

    bool operator==(const Type& other) const;
    bool operator!=(const Type& other) const {
        return !(*this == other);
    }
    bool operator<(const Type& other) const;

private:
    Type_t m_type{Type_t::dynamic};
};

/// \brief dynamic element type
/// \ingroup tir_element_cpp_api
inline constexpr Type dynamic(Type_t::dynamic);
/// \brief boolean element type
/// \ingroup tir_element_cpp_api
inline constexpr Type boolean(Type_t::boolean);
/// \brief f16 element type
/// \ingroup tir_element_cpp_api
inline constexpr Type f16(Type_t::f16);
/// \brief f32 element type
/// \ingroup tir_element_cpp_api
inline constexpr Type f32(Type_t::f32);
/// \brief f64 element type
/// \ingroup tir_element_cpp_api
inline constexpr Type f64(Type_t::f64);
/// \brief i32 element type
/// \ingroup tir_element_cpp_api
inline constexpr Type i32(Type_t::i32);
/// \brief i64 element type
/// \ingroup tir_element_cpp_api
inline constexpr Type i64(Type_t::i64);
/// \brief u8 element type
/// \ingroup tir_element_cpp_api
inline constexpr Type u8(Type_t::u8);

TENSORIR_API
std::ostream& operator<<(std::ostream& out, const tir::element::Type& obj);

TENSORIR_API
std::istream& operator>>(std::istream& out, tir::element::Type& obj);
}  // namespace element
}  // namespace tir
