/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpSettings.hpp"
#include "HotpGenerator.hpp"
#include "TotpGenerator.hpp"
#include "../json/JsonObject.hpp"
#include <limits.h>
#include <new>
#include <strings.h>

namespace otpkit {

struct SettingsJson:
    public JsonObject
{
    OTP_JSON_STRING(type, "type", "totp")
    OTP_JSON_STRING(algorithm, "algorithm", "SHA1")
    OTP_JSON_INTEGER(digits, "digits", 6)
    OTP_JSON_INTEGER(timeStep, "timeStep", 30)
    OTP_JSON_INTEGER(lookBackward, "lookBackward", 1)
    OTP_JSON_INTEGER(lookForward, "lookForward", 1)
};

static Status
intValue(int &result, json_int_t value, const char *key)
{
    if (value < INT_MIN || INT_MAX < value)
        return OTP_ERROR(OTP_CC_JSONError,
                         "Out of range JSON value for " + std::string(key));
    result = static_cast<int>(value);
    return Status();
}

static Status
settingsFromJson(OtpSettings &result, const SettingsJson &json)
{
    OTP_CHECK(json.ok());
    OTP_CHECK(json.typeOk());
    OTP_CHECK(json.algorithmOk());
    OTP_CHECK(json.digitsOk());
    OTP_CHECK(json.timeStepOk());
    OTP_CHECK(json.lookBackwardOk());
    OTP_CHECK(json.lookForwardOk());

    OtpSettings out;
    if (!strcasecmp(json.type(), "hotp"))
        out.type = OtpType::HOTP;
    else if (!strcasecmp(json.type(), "totp"))
        out.type = OtpType::TOTP;
    else
        return OTP_ERROR(OTP_CC_JSONError,
                         "Unknown OTP type " + std::string(json.type()));

    Status s = hashAlgorithmFromName(out.algorithm, json.algorithm());
    if (!s)
        return OTP_ERROR(OTP_CC_JSONError, s.message());

    OTP_CHECK(intValue(out.digits, json.digits(), "digits"));
    out.timeStep = json.timeStep();
    OTP_CHECK(intValue(out.lookBackward, json.lookBackward(), "lookBackward"));
    OTP_CHECK(intValue(out.lookForward, json.lookForward(), "lookForward"));

    result = out;
    return Status();
}

static Status
settingsToJson(SettingsJson &json, const OtpSettings &settings)
{
    OTP_CHECK(json.typeSet(OtpType::HOTP == settings.type ? "hotp" : "totp"));
    OTP_CHECK(json.algorithmSet(hashAlgorithmName(settings.algorithm)));
    OTP_CHECK(json.digitsSet(settings.digits));
    if (OtpType::TOTP == settings.type)
    {
        OTP_CHECK(json.timeStepSet(settings.timeStep));
        OTP_CHECK(json.lookBackwardSet(settings.lookBackward));
        OTP_CHECK(json.lookForwardSet(settings.lookForward));
    }
    return Status();
}

Status
settingsDecode(OtpSettings &result, const std::string &json)
{
    SettingsJson settingsJson;
    OTP_CHECK(settingsJson.decode(json));
    OTP_CHECK(settingsFromJson(result, settingsJson));
    return Status();
}

std::string
settingsEncode(const OtpSettings &settings)
{
    SettingsJson json;
    Status s = settingsToJson(json, settings);
    if (!s)
        throw std::bad_alloc();
    return json.encode();
}

Status
settingsLoad(OtpSettings &result, const std::string &path)
{
    SettingsJson json;
    OTP_CHECK(json.load(path));
    OTP_CHECK(settingsFromJson(result, json));
    return Status();
}

Status
settingsSave(const OtpSettings &settings, const std::string &path)
{
    SettingsJson json;
    OTP_CHECK(settingsToJson(json, settings));
    OTP_CHECK(json.save(path));
    return Status();
}

Status
settingsCreateManager(std::shared_ptr<OtpManager> &result,
                      const OtpSettings &settings, const DataSlice *secret)
{
    if (OtpType::HOTP == settings.type)
    {
        std::shared_ptr<HotpGenerator> hotp;
        OTP_CHECK(HotpGenerator::create(hotp, settings.algorithm, secret,
                                        settings.digits));
        result = hotp;
    }
    else
    {
        std::shared_ptr<TotpGenerator> totp;
        OTP_CHECK(TotpGenerator::create(totp, settings.algorithm, secret,
                                        settings.digits, settings.timeStep,
                                        settings.lookBackward,
                                        settings.lookForward));
        result = totp;
    }
    return Status();
}

} // namespace otpkit
