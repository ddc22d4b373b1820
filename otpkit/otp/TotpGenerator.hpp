/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_OTP_TOTP_GENERATOR_HPP
#define OTPKIT_OTP_TOTP_GENERATOR_HPP

#include "HotpGenerator.hpp"

namespace otpkit {

/**
 * Implements the time-based TOTP algorithm defined by rfc6238.
 *
 * The look-backward and look-forward windows only affect validation.
 * They allow for clock drift between the two parties,
 * and can be set to 0 to accept the current time step alone.
 */
class TotpGenerator:
    public OtpManager
{
public:
    /**
     * Validates the parameters and builds a generator.
     * The algorithm, secret and digits follow HotpGenerator::create.
     *
     * @param timeStep Length of one time step in seconds.
     * @param lookBackward Number of earlier time steps accepted.
     * @param lookForward Number of later time steps accepted.
     */
    static Status
    create(std::shared_ptr<TotpGenerator> &result, HashAlgorithm algorithm,
           const DataSlice *secret, int digits, int64_t timeStep,
           int lookBackward, int lookForward);

    const HotpGenerator &hotp() const { return hotp_; }
    int64_t timeStep() const { return timeStep_; }
    int lookBackward() const { return lookBackward_; }
    int lookForward() const { return lookForward_; }

    std::string
    generate(int64_t epoch) const override;

    bool
    validate(int64_t epoch, const std::string &code) const override;

    /**
     * Produces the password for the current system time.
     */
    std::string
    generateNow() const;

    /**
     * Validates a code against the current system time.
     */
    bool
    validateNow(const std::string &code) const;

private:
    const HotpGenerator hotp_;
    const int64_t timeStep_;
    const int lookBackward_;
    const int lookForward_;

    TotpGenerator(const HotpGenerator &hotp, int64_t timeStep,
                  int lookBackward, int lookForward);
};

} // namespace otpkit

#endif
