// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/type/element_type.hpp"

#include <map>
#include <sstream>
#include <utility>
#include <vector>

#include "common_test_utils/test_assertions.hpp"
#include "gtest/gtest.h"
#include "tensorir/core/except.hpp"

using namespace tir;

namespace {
const std::vector<std::pair<std::string, element::Type>> element_type_cases{{"boolean", element::boolean},
                                                                            {"BOOL", element::boolean},
                                                                            {"f16", element::f16},
                                                                            {"FP16", element::f16},
                                                                            {"f32", element::f32},
                                                                            {"FP32", element::f32},
                                                                            {"f64", element::f64},
                                                                            {"FP64", element::f64},
                                                                            {"i32", element::i32},
                                                                            {"I32", element::i32},
                                                                            {"i64", element::i64},
                                                                            {"I64", element::i64},
                                                                            {"u8", element::u8},
                                                                            {"U8", element::u8},
                                                                            {"dynamic", element::dynamic}};

const std::vector<std::string> element_type_cases_invalid{"some_string", "", "???", "12345", "bf16"};
}  // namespace

TEST(element_type, from_string) {
    for (const auto& [str, expected] : element_type_cases) {
        EXPECT_EQ(element::Type(str), expected);
    }
}

TEST(element_type, from_string_invalid) {
    for (const auto& str : element_type_cases_invalid) {
        TENSORIR_EXPECT_THROW(std::ignore = element::Type(str), tir::Exception, testing::_);
    }
}

TEST(element_type, from_istringstream) {
    for (const auto& [str, expected] : element_type_cases) {
        std::istringstream ss(str);
        element::Type t;
        ss >> t;
        EXPECT_FALSE(ss.fail());
        EXPECT_EQ(t, expected);
    }
}

TEST(element_type, print) {
    std::ostringstream ss;
    ss << element::f16 << " " << element::f32;
    EXPECT_EQ(ss.str(), "f16 f32");
}

TEST(element_type, properties) {
    EXPECT_TRUE(element::f16.is_real());
    EXPECT_TRUE(element::f32.is_real());
    EXPECT_FALSE(element::i32.is_real());
    EXPECT_TRUE(element::i64.is_integral_number());
    EXPECT_FALSE(element::boolean.is_integral_number());
    EXPECT_FALSE(element::u8.is_signed());
    EXPECT_EQ(element::f16.bitwidth(), 16u);
    EXPECT_EQ(element::f32.size(), 4u);
    EXPECT_EQ(element::f64.c_type_string(), "double");
    EXPECT_TRUE(element::dynamic.is_dynamic());
    EXPECT_FALSE(element::dynamic.is_static());
}

TEST(element_type, mapable) {
    std::map<element::Type, std::string> test_map;

    test_map.insert({element::f32, "float"});
    EXPECT_EQ(test_map.at(element::f32), "float");
}

TEST(element_type, pooling_input_types) {
    for (const auto& t : {element::f16, element::f32}) {
        EXPECT_TRUE(t.is_static() && t.is_real()) << t;
    }
    for (const auto& t : {element::i32, element::u8, element::boolean}) {
        EXPECT_FALSE(t.is_real()) << t;
    }
}
