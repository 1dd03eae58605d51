// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#if defined(_WIN32)
#    define TENSORIR_CORE_IMPORTS __declspec(dllimport)
#    define TENSORIR_CORE_EXPORTS __declspec(dllexport)
#else
#    define TENSORIR_CORE_IMPORTS __attribute__((visibility("default")))
#    define TENSORIR_CORE_EXPORTS __attribute__((visibility("default")))
#endif

#ifdef TENSORIR_STATIC_LIBRARY
#    define TENSORIR_API
#else
#    ifdef IMPLEMENT_TENSORIR_API  // defined if we are building the tensorir DLL (instead of using it)
#        define TENSORIR_API        TENSORIR_CORE_EXPORTS
#    else
#        define TENSORIR_API        TENSORIR_CORE_IMPORTS
#    endif  // IMPLEMENT_TENSORIR_API
#endif      // TENSORIR_STATIC_LIBRARY
