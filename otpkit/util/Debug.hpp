/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_UTIL_DEBUG_HPP
#define OTPKIT_UTIL_DEBUG_HPP

#include "Status.hpp"
#include "Data.hpp"

#define DEBUG_LEVEL 1

#define OTP_DebugLevel(level, ...)  \
{                                   \
    if (DEBUG_LEVEL >= level)       \
    {                               \
        otpkit::OTP_DebugLog(__VA_ARGS__); \
    }                               \
}

namespace otpkit {

/**
 * Starts mirroring the debug log into a file.
 * An existing file at the path is rotated out of the way first.
 */
Status
debugInitialize(const std::string &path);

void
debugTerminate();

/**
 * Reads back the current and previous log files.
 */
DataChunk
debugLogLoad();

void OTP_DebugLog(const char *format, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace otpkit

#endif
