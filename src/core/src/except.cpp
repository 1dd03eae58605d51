// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/core/except.hpp"

#include "tensorir/util/common_util.hpp"

namespace tir {
namespace {
void append_section(std::ostream& out, const std::string& section) {
    if (!section.empty())
        out << ":\n" << section;
}
}  // namespace

const std::string Exception::default_msg{};

Exception::Exception(const std::string& what_arg) : std::runtime_error(what_arg) {}

Exception::~Exception() = default;

AssertFailure::~AssertFailure() = default;

std::string Exception::make_what(const char* file,
                                 int line,
                                 const char* check_string,
                                 const std::string& context_info,
                                 const std::string& explanation) {
    std::ostringstream what;
    const auto location = util::trim_file_name(file) + ":" + std::to_string(line);
    if (check_string)
        what << "Check '" << check_string << "' failed at " << location;
    else
        what << "Exception from " << location;
    append_section(what, context_info);
    append_section(what, explanation);
    what << '\n';
    return what.str();
}

void Exception::create(const char* file, int line, const std::string& explanation) {
    throw Exception(make_what(file, line, nullptr, default_msg, explanation));
}

void AssertFailure::create(const char* file,
                           int line,
                           const char* check_string,
                           const std::string& context_info,
                           const std::string& explanation) {
    throw AssertFailure(make_what(file, line, check_string, context_info, explanation));
}

}  // namespace tir
