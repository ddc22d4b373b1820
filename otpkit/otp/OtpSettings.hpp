/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Stored OTP parameters. The secret key is never part of the settings.
 */

#ifndef OTPKIT_OTP_OTP_SETTINGS_HPP
#define OTPKIT_OTP_OTP_SETTINGS_HPP

#include "OtpManager.hpp"
#include "../crypto/HashAlgorithm.hpp"
#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <memory>

namespace otpkit {

enum class OtpType
{
    HOTP,
    TOTP
};

/**
 * Parameters for building an OtpManager.
 * The time step and window fields only apply to TOTP.
 */
struct OtpSettings
{
    OtpType type = OtpType::TOTP;
    HashAlgorithm algorithm = HashAlgorithm::SHA1;
    int digits = 6;
    int64_t timeStep = 30;
    int lookBackward = 1;
    int lookForward = 1;
};

/**
 * Reads settings from a JSON string.
 * Missing keys keep their default values.
 */
Status
settingsDecode(OtpSettings &result, const std::string &json);

/**
 * Writes settings as a JSON string.
 */
std::string
settingsEncode(const OtpSettings &settings);

Status
settingsLoad(OtpSettings &result, const std::string &path);

Status
settingsSave(const OtpSettings &settings, const std::string &path);

/**
 * Builds the HOTP or TOTP engine described by the settings.
 *
 * @param secret The HMAC key, or nullptr to generate one.
 */
Status
settingsCreateManager(std::shared_ptr<OtpManager> &result,
                      const OtpSettings &settings, const DataSlice *secret);

} // namespace otpkit

#endif
