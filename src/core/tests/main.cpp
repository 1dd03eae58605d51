// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "gtest/gtest.h"
#include "tensorir/util/log.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Warnings from negative tests would otherwise flood the test log.
    const tir::util::LogCallback silent{};
    tir::util::set_log_callback(silent);
    int rc = RUN_ALL_TESTS();
    tir::util::reset_log_callback();

    return rc;
}
