/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "TotpGenerator.hpp"
#include <time.h>

namespace otpkit {

TotpGenerator::TotpGenerator(const HotpGenerator &hotp, int64_t timeStep,
                             int lookBackward, int lookForward):
    hotp_(hotp),
    timeStep_(timeStep),
    lookBackward_(lookBackward),
    lookForward_(lookForward)
{
}

Status
TotpGenerator::create(std::shared_ptr<TotpGenerator> &result,
                      HashAlgorithm algorithm, const DataSlice *secret,
                      int digits, int64_t timeStep,
                      int lookBackward, int lookForward)
{
    std::shared_ptr<HotpGenerator> hotp;
    OTP_CHECK(HotpGenerator::create(hotp, algorithm, secret, digits));

    if (timeStep <= 0)
        return OTP_ERROR(OTP_CC_InvalidTimeStep, "Invalid time step " +
                         std::to_string(timeStep));
    if (lookBackward < 0)
        return OTP_ERROR(OTP_CC_InvalidLookBackward,
                         "Invalid look-backward value " +
                         std::to_string(lookBackward));
    if (lookForward < 0)
        return OTP_ERROR(OTP_CC_InvalidLookForward,
                         "Invalid look-forward value " +
                         std::to_string(lookForward));

    result.reset(new TotpGenerator(*hotp, timeStep, lookBackward, lookForward));
    return Status();
}

std::string
TotpGenerator::generate(int64_t epoch) const
{
    // Integer division truncates toward zero, as rfc6238 expects:
    return hotp_.generate(epoch / timeStep_);
}

bool
TotpGenerator::validate(int64_t epoch, const std::string &code) const
{
    for (int64_t i = -lookBackward_; i <= lookForward_; ++i)
    {
        // The shifted time wraps around in two's complement rather than
        // overflowing, so huge time steps still give a defined window:
        uint64_t shifted = static_cast<uint64_t>(epoch) +
            static_cast<uint64_t>(i) * static_cast<uint64_t>(timeStep_);
        int64_t counter = static_cast<int64_t>(shifted) / timeStep_;
        if (hotp_.validate(counter, code))
            return true;
    }
    return false;
}

std::string
TotpGenerator::generateNow() const
{
    return generate(time(nullptr));
}

bool
TotpGenerator::validateNow(const std::string &code) const
{
    return validate(time(nullptr), code);
}

} // namespace otpkit
