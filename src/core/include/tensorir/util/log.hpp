// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

#include "tensorir/core/core_visibility.hpp"

namespace tir {
namespace util {

enum class LOG_TYPE {
    _LOG_TYPE_ERROR,
    _LOG_TYPE_WARNING,
    _LOG_TYPE_INFO,
    _LOG_TYPE_DEBUG,
};

using LogCallback = std::function<void(std::string_view)>;

/// \brief Replaces the sink which receives every formatted log message.
/// An empty callback silences logging until reset_log_callback() is called.
/// The callback object must outlive its registration.
TENSORIR_API void set_log_callback(const LogCallback& callback);

/// \brief Restores the default sink, which prints to std::cout.
TENSORIR_API void reset_log_callback();

TENSORIR_API void log_message(std::string_view message);

/// \brief Returns true if TENSORIR_VERBOSE_LOGGING enables debug messages.
TENSORIR_API bool is_verbose_logging();

class TENSORIR_API LogHelper {
public:
    LogHelper(LOG_TYPE, const char* file, int line);
    ~LogHelper();

    std::ostream& stream() {
        return m_stream;
    }

private:
    std::stringstream m_stream;
};

}  // namespace util
}  // namespace tir

#define TENSORIR_ERR                                                        \
    ::tir::util::LogHelper(::tir::util::LOG_TYPE::_LOG_TYPE_ERROR, __FILE__, __LINE__).stream()

#define TENSORIR_WARN                                                       \
    ::tir::util::LogHelper(::tir::util::LOG_TYPE::_LOG_TYPE_WARNING, __FILE__, __LINE__).stream()

#define TENSORIR_INFO                                                       \
    ::tir::util::LogHelper(::tir::util::LOG_TYPE::_LOG_TYPE_INFO, __FILE__, __LINE__).stream()

#define TENSORIR_DEBUG                                                                 \
    if (!::tir::util::is_verbose_logging()) {                                          \
    } else                                                                             \
        ::tir::util::LogHelper(::tir::util::LOG_TYPE::_LOG_TYPE_DEBUG, __FILE__, __LINE__).stream()
