/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Status.hpp"
#include "Debug.hpp"
#include <sstream>

namespace otpkit {

Status::Status() :
    value_(OTP_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tOTP_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(std::move(message)),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        std::stringstream ss;
        ss << *this;
        OTP_DebugLog("%s", ss.str().c_str());
    }
    return *this;
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() << " (" << s.message() << ")";
    return output;
}

} // namespace otpkit
