// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "tensorir/util/log.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

#include "tensorir/util/common_util.hpp"
#include "tensorir/util/env_util.hpp"

namespace tir {
namespace util {
namespace {
const LogCallback default_callback{[](std::string_view s) {
    std::cout << s << std::endl;
}};

const LogCallback silent_callback{[](std::string_view) {}};

const LogCallback* current_callback = &default_callback;
}  // namespace

void reset_log_callback() {
    current_callback = &default_callback;
}

void set_log_callback(const LogCallback& callback) {
    if (!callback) {
        current_callback = &silent_callback;
    } else {
        current_callback = &callback;
    }
}

void log_message(std::string_view message) {
    (*current_callback)(message);
}

bool is_verbose_logging() {
    // Switch on verbose logging using TENSORIR_VERBOSE_LOGGING=true
    static const bool verbose = getenv_bool("TENSORIR_VERBOSE_LOGGING");
    return verbose;
}

LogHelper::LogHelper(LOG_TYPE type, const char* file, int line) {
    switch (type) {
    case LOG_TYPE::_LOG_TYPE_ERROR:
        m_stream << "[ERROR] ";
        break;
    case LOG_TYPE::_LOG_TYPE_WARNING:
        m_stream << "[WARNING] ";
        break;
    case LOG_TYPE::_LOG_TYPE_INFO:
        m_stream << "[INFO] ";
        break;
    case LOG_TYPE::_LOG_TYPE_DEBUG:
        m_stream << "[DEBUG] ";
        break;
    }

    time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    if (gmtime_r(&tt, &tm_buf)) {
        char buffer[256];
        strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%Sz", &tm_buf);
        m_stream << buffer << " ";
    }

    m_stream << trim_file_name(file);
    m_stream << " " << line;
    m_stream << "\t";
}

LogHelper::~LogHelper() {
    log_message(m_stream.str());
}
}  // namespace util
}  // namespace tir
