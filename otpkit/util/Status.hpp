/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_UTIL_STATUS_HPP
#define OTPKIT_UTIL_STATUS_HPP

#include "../../src/OTP.h"
#include <stddef.h>
#include <ostream>
#include <string>
#include <utility>

namespace otpkit {

/**
 * Describes the results of calling a library function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tOTP_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tOTP_CC value()             const { return value_; }
    const std::string &message() const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == OTP_CC_Ok; }

    /**
     * Writes the status to the debug log if it represents an error.
     * Returns the status unchanged, so this can be chained.
     */
    const Status &log() const;

private:
    // Error information:
    tOTP_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define OTP_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define OTP_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

} // namespace otpkit

#endif
