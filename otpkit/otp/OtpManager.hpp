/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_OTP_OTP_MANAGER_HPP
#define OTPKIT_OTP_OTP_MANAGER_HPP

#include <stdint.h>
#include <string>

namespace otpkit {

/**
 * A one-time password generator and validator.
 * The moving factor is a counter for HOTP and a Unix time for TOTP.
 *
 * Implementations are immutable once created,
 * so a single instance may be shared between threads.
 */
class OtpManager
{
public:
    virtual ~OtpManager() {}

    /**
     * Produces the password for a moving factor.
     */
    virtual std::string
    generate(int64_t movingFactor) const = 0;

    /**
     * Returns true if the code matches the password for a moving factor.
     */
    virtual bool
    validate(int64_t movingFactor, const std::string &code) const = 0;
};

} // namespace otpkit

#endif
