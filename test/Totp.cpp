/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpkit/otp/TotpGenerator.hpp"
#include <catch2/catch.hpp>

using otpkit::HashAlgorithm;
using otpkit::TotpGenerator;

static const std::string sha1Key = "12345678901234567890";
static const std::string sha256Key = "12345678901234567890123456789012";
static const std::string sha512Key =
    "1234567890123456789012345678901234567890123456789012345678901234";

TEST_CASE("RFC 6238 test vectors", "[otp][totp]")
{
    struct TestCase
    {
        int64_t time;
        const char *sha1;
        const char *sha256;
        const char *sha512;
    };
    TestCase cases[] =
    {
        {59,          "94287082", "46119246", "90693936"},
        {1111111109,  "07081804", "68084774", "25091201"},
        {1111111111,  "14050471", "67062674", "99943326"},
        {1234567890,  "89005924", "91819424", "93441116"},
        {2000000000,  "69279037", "90698825", "38618901"},
        {20000000000, "65353130", "77737706", "47863826"}
    };

    otpkit::DataSlice key1(sha1Key), key256(sha256Key), key512(sha512Key);
    std::shared_ptr<TotpGenerator> sha1, sha256, sha512;
    REQUIRE(TotpGenerator::create(sha1, HashAlgorithm::SHA1, &key1,
                                  8, 30, 0, 0));
    REQUIRE(TotpGenerator::create(sha256, HashAlgorithm::SHA256, &key256,
                                  8, 30, 0, 0));
    REQUIRE(TotpGenerator::create(sha512, HashAlgorithm::SHA512, &key512,
                                  8, 30, 0, 0));

    for (auto &test: cases)
    {
        REQUIRE(sha1->generate(test.time) == test.sha1);
        REQUIRE(sha256->generate(test.time) == test.sha256);
        REQUIRE(sha512->generate(test.time) == test.sha512);

        REQUIRE(sha1->validate(test.time, test.sha1));
        REQUIRE(sha256->validate(test.time, test.sha256));
        REQUIRE(sha512->validate(test.time, test.sha512));
    }
}

TEST_CASE("TOTP delegates to the counter engine", "[otp][totp]")
{
    otpkit::DataSlice key(sha1Key);
    std::shared_ptr<TotpGenerator> totp;
    REQUIRE(TotpGenerator::create(totp, HashAlgorithm::SHA1, &key,
                                  6, 30, 0, 0));

    // The RFC 4226 vectors reappear at multiples of the time step:
    REQUIRE(totp->generate(0) == "755224");
    REQUIRE(totp->generate(29) == "755224");
    REQUIRE(totp->generate(30) == "287082");
    REQUIRE(totp->generate(9 * 30 + 15) == "520489");

    REQUIRE(totp->hotp().digits() == 6);
    REQUIRE(totp->timeStep() == 30);
}

TEST_CASE("Negative times truncate toward zero", "[otp][totp]")
{
    otpkit::DataSlice key(sha1Key);
    std::shared_ptr<TotpGenerator> totp;
    REQUIRE(TotpGenerator::create(totp, HashAlgorithm::SHA1, &key,
                                  6, 30, 0, 0));

    // -1 through -29 all share counter 0 with the first window:
    REQUIRE(totp->generate(-1) == "755224");
    REQUIRE(totp->generate(-29) == "755224");

    // -30 is the first time in counter -1:
    REQUIRE(totp->generate(-30) == totp->hotp().generate(-1));
    REQUIRE(totp->generate(-59) == totp->hotp().generate(-1));
    REQUIRE(totp->generate(-60) == totp->hotp().generate(-2));
}

TEST_CASE("Clock drift window", "[otp][totp]")
{
    otpkit::DataSlice key(sha1Key);
    std::shared_ptr<TotpGenerator> totp;
    REQUIRE(TotpGenerator::create(totp, HashAlgorithm::SHA1, &key,
                                  8, 30, 1, 2));
    REQUIRE(totp->lookBackward() == 1);
    REQUIRE(totp->lookForward() == 2);

    const int64_t e = 1111111109;

    SECTION("codes from neighbouring steps are accepted at e")
    {
        REQUIRE(totp->validate(e, totp->generate(e)));
        REQUIRE(totp->validate(e, totp->generate(e - 30)));
        REQUIRE(totp->validate(e, totp->generate(e + 30)));
        REQUIRE(totp->validate(e, totp->generate(e + 60)));
        REQUIRE_FALSE(totp->validate(e, totp->generate(e - 60)));
        REQUIRE_FALSE(totp->validate(e, totp->generate(e + 90)));
    }

    SECTION("a code made at e is accepted by drifting validators")
    {
        auto code = totp->generate(e);
        REQUIRE(code == "07081804");
        REQUIRE(totp->validate(e + 30, code));
        REQUIRE(totp->validate(e - 30, code));
        REQUIRE(totp->validate(e - 60, code));
        REQUIRE_FALSE(totp->validate(e + 60, code));
        REQUIRE_FALSE(totp->validate(e - 90, code));
    }
}

TEST_CASE("Zero-width window only accepts the current step", "[otp][totp]")
{
    otpkit::DataSlice key(sha1Key);
    std::shared_ptr<TotpGenerator> totp;
    REQUIRE(TotpGenerator::create(totp, HashAlgorithm::SHA1, &key,
                                  8, 30, 0, 0));

    REQUIRE(totp->validate(59, "94287082"));
    REQUIRE(totp->validate(30, "94287082"));
    REQUIRE_FALSE(totp->validate(29, "94287082"));
    REQUIRE_FALSE(totp->validate(60, "94287082"));
}

TEST_CASE("Current time round trip", "[otp][totp]")
{
    std::shared_ptr<TotpGenerator> totp;
    REQUIRE(TotpGenerator::create(totp, HashAlgorithm::SHA256, nullptr,
                                  6, 30, 1, 1));
    REQUIRE(totp->hotp().secret().size() == 32);

    auto code = totp->generateNow();
    REQUIRE(code.size() == 6);
    REQUIRE(totp->validateNow(code));
}

TEST_CASE("Bad TOTP parameters", "[otp][totp]")
{
    std::shared_ptr<TotpGenerator> totp;
    otpkit::DataSlice key(sha1Key);

    auto s = TotpGenerator::create(totp, static_cast<HashAlgorithm>(-1),
                                   nullptr, 6, 30, 0, 0);
    REQUIRE(s.value() == OTP_CC_UnknownAlgorithm);

    s = TotpGenerator::create(totp, HashAlgorithm::SHA1, &key, 0, 30, 0, 0);
    REQUIRE(s.value() == OTP_CC_InvalidDigitCount);
    s = TotpGenerator::create(totp, HashAlgorithm::SHA1, &key, 9, 30, 0, 0);
    REQUIRE(s.value() == OTP_CC_InvalidDigitCount);

    s = TotpGenerator::create(totp, HashAlgorithm::SHA1, &key, 6, 0, 0, 0);
    REQUIRE(s.value() == OTP_CC_InvalidTimeStep);
    s = TotpGenerator::create(totp, HashAlgorithm::SHA1, &key, 6, -30, 0, 0);
    REQUIRE(s.value() == OTP_CC_InvalidTimeStep);

    s = TotpGenerator::create(totp, HashAlgorithm::SHA1, &key, 6, 30, -1, 0);
    REQUIRE(s.value() == OTP_CC_InvalidLookBackward);
    s = TotpGenerator::create(totp, HashAlgorithm::SHA1, &key, 6, 30, 0, -1);
    REQUIRE(s.value() == OTP_CC_InvalidLookForward);

    // The digit count is checked before the time step:
    s = TotpGenerator::create(totp, HashAlgorithm::SHA1, &key, 9, 0, -1, -1);
    REQUIRE(s.value() == OTP_CC_InvalidDigitCount);

    REQUIRE_FALSE(totp);
}

TEST_CASE("Drift window across time zero", "[otp][totp]")
{
    otpkit::DataSlice key(sha1Key);

    SECTION("looking backward from just after zero")
    {
        std::shared_ptr<TotpGenerator> totp;
        REQUIRE(TotpGenerator::create(totp, HashAlgorithm::SHA1, &key,
                                      8, 30, 1, 0));

        // (10 - 30) / 30 truncates to counter 0, not -1:
        REQUIRE(totp->validate(10, totp->hotp().generate(0)));
        REQUIRE_FALSE(totp->validate(10, totp->hotp().generate(-1)));
    }

    SECTION("looking forward from just before zero")
    {
        std::shared_ptr<TotpGenerator> totp;
        REQUIRE(TotpGenerator::create(totp, HashAlgorithm::SHA1, &key,
                                      8, 30, 0, 1));

        // (-10 + 30) / 30 truncates to counter 0, not 1:
        REQUIRE(totp->validate(-10, totp->hotp().generate(0)));
        REQUIRE_FALSE(totp->validate(-10, totp->hotp().generate(1)));
    }
}

TEST_CASE("Huge time steps wrap instead of overflowing", "[otp][totp]")
{
    const int64_t step = INT64_MAX / 2 + 1;

    otpkit::DataSlice key(sha1Key);
    std::shared_ptr<TotpGenerator> totp;
    REQUIRE(TotpGenerator::create(totp, HashAlgorithm::SHA1, &key,
                                  8, step, 0, 2));
    REQUIRE(totp->generate(1) == totp->hotp().generate(0));

    // The window visits 1, 1 + step and 1 + 2 * step, which wraps
    // to INT64_MIN + 1 and lands in counter -1:
    REQUIRE(totp->validate(1, totp->hotp().generate(0)));
    REQUIRE(totp->validate(1, totp->hotp().generate(1)));
    REQUIRE(totp->validate(1, totp->hotp().generate(-1)));
    REQUIRE_FALSE(totp->validate(1, totp->hotp().generate(2)));
}
