// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/util/common_util.hpp"

#include <algorithm>
#include <cctype>

std::string tir::util::to_lower(const std::string& s) {
    std::string rc = s;
    std::transform(rc.begin(), rc.end(), rc.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return rc;
}

std::string tir::util::trim(const std::string& s) {
    const auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    auto first = std::find_if_not(s.begin(), s.end(), is_space);
    auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string{};
}

std::string tir::util::trim_file_name(const std::string& file_name) {
#ifdef PROJECT_ROOT_DIR
    static const std::string project_root(PROJECT_ROOT_DIR);
    // All internal paths start from project root
    if (!project_root.empty() && file_name.find(project_root) == 0 && file_name.size() > project_root.size()) {
        // Add +1 to remove first /
        return file_name.substr(project_root.length() + 1);
    }
#endif
    return file_name;
}
