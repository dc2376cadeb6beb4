/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
    #define MDK_WINDOWS 1
#else
    #define MDK_WINDOWS 0
#endif

#if defined(__APPLE__)
    #include <TargetConditionals.h>
    #if TARGET_OS_OSX
        #define MDK_MACOS 1
    #else
        #define MDK_MACOS 0
    #endif
#else
    #define MDK_MACOS 0
#endif

#if defined(__linux__)
    #define MDK_LINUX 1
#else
    #define MDK_LINUX 0
#endif

#if MDK_WINDOWS && !defined(NOMINMAX)
    #error "Please define NOMINMAX as compile constant in your build system."
#endif

#if defined(_MSC_VER)
    #define MDK_FUNCTION __FUNCSIG__
#else
    #define MDK_FUNCTION __PRETTY_FUNCTION__
#endif
