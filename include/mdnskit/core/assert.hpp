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

#include "log.hpp"
#include "platform.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

/**
 * When MDK_LOG_ON_ASSERT is 1 a failed assertion is logged at critical level. Default is on.
 */
#ifndef MDK_LOG_ON_ASSERT
    #define MDK_LOG_ON_ASSERT 1
#endif

/**
 * When MDK_THROW_EXCEPTION_ON_ASSERT is 1 a failed assertion throws mdk::AssertionFailure. Default is off.
 */
#ifndef MDK_THROW_EXCEPTION_ON_ASSERT
    #define MDK_THROW_EXCEPTION_ON_ASSERT 0
#endif

/**
 * When MDK_ABORT_ON_ASSERT is 1 a failed assertion aborts the process. Default is off.
 */
#ifndef MDK_ABORT_ON_ASSERT
    #define MDK_ABORT_ON_ASSERT 0
#endif

namespace mdk {

/**
 * Thrown by a failed assertion when MDK_THROW_EXCEPTION_ON_ASSERT is enabled.
 */
class AssertionFailure: public std::logic_error {
  public:
    AssertionFailure(const std::string& message, const char* file, const int line, const char* function_name) :
        std::logic_error(message), file_(file), line_(line), function_name_(function_name) {}

    [[nodiscard]] const char* file() const {
        return file_;
    }

    [[nodiscard]] int line() const {
        return line_;
    }

    [[nodiscard]] const char* function_name() const {
        return function_name_;
    }

  private:
    const char* file_ {};
    int line_ {};
    const char* function_name_ {};
};

}  // namespace mdk

#define MDK_ASSERTION_FAILED_NO_THROW(message)                         \
    if (MDK_LOG_ON_ASSERT) {                                           \
        MDK_CRITICAL("Assertion failure: " message);                   \
    }                                                                  \
    if (MDK_ABORT_ON_ASSERT) {                                         \
        std::cerr << "Abort on assertion: " << (message) << std::endl; \
        std::abort();                                                  \
    }

#define MDK_ASSERTION_FAILED(message)                                                                        \
    MDK_ASSERTION_FAILED_NO_THROW(message)                                                                   \
    if (MDK_THROW_EXCEPTION_ON_ASSERT) {                                                                     \
        throw mdk::AssertionFailure("Assertion failure: " message, __FILE__, __LINE__, MDK_FUNCTION);        \
    }

/**
 * Asserts the condition to be true, otherwise logs, throws or aborts depending on the MDK_*_ON_ASSERT settings.
 */
#define MDK_ASSERT(condition, message)     \
    do {                                   \
        if (!(condition)) {                \
            MDK_ASSERTION_FAILED(message)  \
        }                                  \
    } while (false)

/**
 * Like MDK_ASSERT, and returns from the calling (void) function when the condition is false.
 */
#define MDK_ASSERT_RETURN(condition, message) \
    do {                                      \
        if (!(condition)) {                   \
            MDK_ASSERTION_FAILED(message)     \
            return;                           \
        }                                     \
    } while (false)

/**
 * Like MDK_ASSERT, and returns `return_value` from the calling function when the condition is false.
 */
#define MDK_ASSERT_RETURN_WITH(condition, message, return_value) \
    do {                                                         \
        if (!(condition)) {                                      \
            MDK_ASSERTION_FAILED(message)                        \
            return return_value;                                 \
        }                                                        \
    } while (false)

/**
 * Like MDK_ASSERT but never throws. For destructors.
 */
#define MDK_ASSERT_NO_THROW(condition, message)       \
    do {                                              \
        if (!(condition)) {                           \
            MDK_ASSERTION_FAILED_NO_THROW(message)    \
        }                                             \
    } while (false)
