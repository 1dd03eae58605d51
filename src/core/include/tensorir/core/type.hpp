// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <type_traits>

#include "tensorir/core/core_visibility.hpp"

namespace tir {

/// Supports three functions, is_type<Type>, as_type<Type>, and as_type_ptr<Type> for type-safe
/// dynamic conversions via static_cast/static_ptr_cast without using C++ RTTI.
/// Type must have a static type_info member and a virtual get_type_info() member that
/// returns a reference to its type_info member.

/// Type information for a type system without inheritance; instances have exactly one type not
/// related to any other type.
struct TENSORIR_API DiscreteTypeInfo {
    const char* name;
    const char* version_id;
    // A pointer to a parent type info; used for casting and inheritance traversal, not for
    // exact type identification
    const DiscreteTypeInfo* parent;

    DiscreteTypeInfo() = default;
    DiscreteTypeInfo(const DiscreteTypeInfo&) = default;
    DiscreteTypeInfo(DiscreteTypeInfo&&) = default;
    DiscreteTypeInfo& operator=(const DiscreteTypeInfo&) = default;

    explicit constexpr DiscreteTypeInfo(const char* _name,
                                        const char* _version_id,
                                        const DiscreteTypeInfo* _parent = nullptr)
        : name(_name),
          version_id(_version_id),
          parent(_parent) {}

    bool is_castable(const DiscreteTypeInfo& target_type) const;

    std::string get_version() const;

    // For use as a key
    bool operator<(const DiscreteTypeInfo& b) const;
    bool operator==(const DiscreteTypeInfo& b) const;
    bool operator!=(const DiscreteTypeInfo& b) const;

    operator std::string() const;
};

TENSORIR_API
std::ostream& operator<<(std::ostream& s, const DiscreteTypeInfo& info);

/// \brief Tests if value is a pointer/shared_ptr that can be statically cast to a
/// Type*/shared_ptr<Type>
template <typename Type, typename Value>
typename std::enable_if<
    std::is_convertible<decltype(std::declval<Value>()->get_type_info().is_castable(Type::get_type_info_static())),
                        bool>::value,
    bool>::type
is_type(Value value) {
    return value && value->get_type_info().is_castable(Type::get_type_info_static());
}

/// Casts a Value* to a Type* if it is of type Type, nullptr otherwise
template <typename Type, typename Value>
typename std::enable_if<std::is_convertible<decltype(static_cast<Type*>(std::declval<Value>())), Type*>::value,
                        Type*>::type
as_type(Value value) {
    return is_type<Type>(value) ? static_cast<Type*>(value) : nullptr;
}

/// Casts a std::shared_ptr<Value> to a std::shared_ptr<Type> if it is of type
/// Type, nullptr otherwise
template <typename Type, typename Value>
typename std::enable_if<
    std::is_convertible<decltype(std::static_pointer_cast<Type>(std::declval<Value>())), std::shared_ptr<Type>>::value,
    std::shared_ptr<Type>>::type
as_type_ptr(const Value& value) {
    return is_type<Type>(value) ? std::static_pointer_cast<Type>(value) : std::shared_ptr<Type>();
}

}  // namespace tir

#define _TENSORIR_RTTI_EXPAND(X) X

/// Helper macro that puts necessary declarations of RTTI block inside a class definition.
/// Should be used in the scope of class that requires type identification besides one provided by
/// C++ RTTI.
///
/// Usage:
///     TENSORIR_RTTI(name, version_id, parent)
///
/// \param name is a string constant (char*) that will be the name of the type
/// \param version_id is a string constant (char*) that identifies the operator set the type
///        belongs to
/// \param parent is a parent class that this class is derived from; the parent should have
///        get_type_info_static method defined
#define TENSORIR_RTTI(TYPE_NAME, VERSION_NAME, PARENT_CLASS)                                            \
    static const ::tir::DiscreteTypeInfo& get_type_info_static() {                                      \
        static const ::tir::DiscreteTypeInfo type_info_static{TYPE_NAME,                                \
                                                              VERSION_NAME,                             \
                                                              &PARENT_CLASS::get_type_info_static()};   \
        return type_info_static;                                                                        \
    }                                                                                                   \
    const ::tir::DiscreteTypeInfo& get_type_info() const override {                                     \
        return get_type_info_static();                                                                  \
    }

/// Variant of TENSORIR_RTTI for the root of a hierarchy, which has no parent.
#define TENSORIR_RTTI_BASE(TYPE_NAME, VERSION_NAME)                                        \
    static const ::tir::DiscreteTypeInfo& get_type_info_static() {                         \
        static const ::tir::DiscreteTypeInfo type_info_static{TYPE_NAME, VERSION_NAME};    \
        return type_info_static;                                                           \
    }                                                                                      \
    virtual const ::tir::DiscreteTypeInfo& get_type_info() const {                         \
        return get_type_info_static();                                                     \
    }
