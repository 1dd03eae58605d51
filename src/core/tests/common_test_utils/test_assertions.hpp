// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <exception>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#define TENSORIR_PP_TOSTRING_(x) #x
#define TENSORIR_PP_TOSTRING(x)  TENSORIR_PP_TOSTRING_(x)

/// \brief Expects `statement` to throw `exp_exception` whose what() satisfies the gmock matcher
/// `exception_what_matcher`.
#define TENSORIR_EXPECT_THROW(statement, exp_exception, exception_what_matcher)      \
    try {                                                                            \
        GTEST_SUPPRESS_UNREACHABLE_CODE_WARNING_BELOW_(statement);                   \
        FAIL() << "Expected exception " << TENSORIR_PP_TOSTRING(exp_exception);      \
    } catch (const exp_exception& ex) {                                              \
        EXPECT_THAT(ex.what(), exception_what_matcher);                              \
    } catch (const std::exception& e) {                                              \
        FAIL() << "Unexpected exception " << e.what();                               \
    } catch (...) {                                                                  \
        FAIL() << "Unknown exception";                                               \
    }

#define TENSORIR_EXPECT_THROW_HAS_SUBSTRING(statement, exp_exception, substring) \
    TENSORIR_EXPECT_THROW(statement, exp_exception, ::testing::HasSubstr(substring))
