// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "tensorir/core/core_visibility.hpp"

namespace tir {

/// \brief Writes nothing. Terminates the variadic expansion of write_all_to_stream.
inline std::ostream& write_all_to_stream(std::ostream& str) {
    return str;
}

/// \brief Writes all arguments to the stream in order.
template <typename T, typename... TS>
std::ostream& write_all_to_stream(std::ostream& str, T&& arg, TS&&... args) {
    return write_all_to_stream(str << arg, std::forward<TS>(args)...);
}

/// \brief Base class for tensorir exceptions.
class TENSORIR_API Exception : public std::runtime_error {
public:
    [[noreturn]] static void create(const char* file, int line, const std::string& explanation);
    virtual ~Exception();

    static const std::string default_msg;

protected:
    explicit Exception(const std::string& what_arg);

    static std::string make_what(const char* file,
                                 int line,
                                 const char* check_string,
                                 const std::string& context_info,
                                 const std::string& explanation);
};

/// \brief Base class for check failure exceptions.
class TENSORIR_API AssertFailure : public Exception {
public:
    [[noreturn]] static void create(const char* file,
                                    int line,
                                    const char* check_string,
                                    const std::string& context_info,
                                    const std::string& explanation);
    ~AssertFailure() override;

protected:
    explicit AssertFailure(const std::string& what_arg) : Exception(what_arg) {}
};

}  // namespace tir

// TENSORIR_ASSERT_HELPER(exc_class, ctx, cond, ...) throws exc_class when cond is false. The class
// provides a static create(file, line, check_string, context, explanation). NODE_VALIDATION_CHECK in
// node.hpp is built on it.
#define TENSORIR_ASSERT_HELPER2(exc_class, ctx, check, ...)                      \
    do {                                                                         \
        if (!static_cast<bool>(check)) {                                         \
            ::std::ostringstream ss___;                                          \
            ::tir::write_all_to_stream(ss___, __VA_ARGS__);                      \
            exc_class::create(__FILE__, __LINE__, (#check), (ctx), ss___.str()); \
        }                                                                        \
    } while (0)

#define TENSORIR_ASSERT_HELPER1(exc_class, ctx, check)                                   \
    do {                                                                                 \
        if (!static_cast<bool>(check)) {                                                 \
            exc_class::create(__FILE__, __LINE__, (#check), (ctx), exc_class::default_msg); \
        }                                                                                \
    } while (0)

#define TENSORIR_ASSERT_HELPER(exc_class, ctx, ...) \
    CALL_OVERLOAD(TENSORIR_ASSERT_HELPER, exc_class, ctx, __VA_ARGS__)

// Helper macros for variadic argument dispatch
#define GLUE(x, y)                   x y
#define RETURN_ARG_COUNT(_1_, _2_, _3_, _4_, _5_, _6_, _7_, _8_, _9_, _10_, _11_, _12_, _13_, _14_, _15_, _16_, count, ...) count
#define EXPAND_ARGS(args)            RETURN_ARG_COUNT args
#define COUNT_ARGS_MAXN(...)         EXPAND_ARGS((__VA_ARGS__, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 2, 1, 0))
#define OVERLOAD_MACRO2(name, count) name##count
#define OVERLOAD_MACRO1(name, count) OVERLOAD_MACRO2(name, count)
#define OVERLOAD_MACRO(name, count)  OVERLOAD_MACRO1(name, count)
#define CALL_OVERLOAD(name, exc_class, ctx, ...) \
    GLUE(OVERLOAD_MACRO(name, COUNT_ARGS_MAXN(__VA_ARGS__)), (exc_class, ctx, __VA_ARGS__))

/// \brief Macro to check whether a boolean condition holds.
/// \param cond Condition to check
/// \param ... Additional error message info to be added to the error message via the `<<`
///            stream-insertion operator. Note that the expressions here will be evaluated lazily,
///            i.e., only if the `cond` evaluates to `false`.
/// \throws ::tir::AssertFailure if `cond` is false.
#define TENSORIR_ASSERT(...) TENSORIR_ASSERT_HELPER(::tir::AssertFailure, ::tir::AssertFailure::default_msg, __VA_ARGS__)

#define TENSORIR_THROW_HELPER(exc_class, ...)                \
    do {                                                     \
        ::std::ostringstream ss___;                          \
        ::tir::write_all_to_stream(ss___, __VA_ARGS__);      \
        exc_class::create(__FILE__, __LINE__, ss___.str());  \
    } while (0)

/// \brief Macro to signal a code path that is unreachable in a successful execution.
/// \param ... Additional error message that should describe why that execution path is unreachable.
/// \throws ::tir::Exception if the macro is executed.
#define TENSORIR_THROW(...) TENSORIR_THROW_HELPER(::tir::Exception, __VA_ARGS__)

