/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "HotpGenerator.hpp"
#include "../crypto/Random.hpp"
#include <openssl/crypto.h>
#include <sstream>

namespace otpkit {

static const uint32_t powersOfTen[OTP_MAX_CODE_DIGITS + 1] =
{
    1, 10, 100, 1000, 10000, 100000, 1000000, 10000000, 100000000
};

HotpGenerator::~HotpGenerator()
{
    dataWipe(secret_);
}

HotpGenerator::HotpGenerator(HashAlgorithm algorithm, const EVP_MD *md,
                             DataChunk secret, int digits):
    algorithm_(algorithm),
    md_(md),
    secret_(std::move(secret)),
    digits_(digits)
{
}

Status
HotpGenerator::create(std::shared_ptr<HotpGenerator> &result,
                      HashAlgorithm algorithm, const DataSlice *secret,
                      int digits)
{
    HashAlgorithmInfo info;
    OTP_CHECK(hashAlgorithmInfo(info, algorithm));

    DataChunk key;
    if (secret)
    {
        if (secret->empty())
            return OTP_ERROR(OTP_CC_Error, "The secret key is empty");
        key.assign(secret->begin(), secret->end());
    }
    else
    {
        OTP_CHECK(randomData(key, info.defaultKeySize));
    }

    if (digits <= 0 || OTP_MAX_CODE_DIGITS < digits)
    {
        dataWipe(key);
        return OTP_ERROR(OTP_CC_InvalidDigitCount, "Invalid code digit count " +
                         std::to_string(digits));
    }

    result.reset(new HotpGenerator(algorithm, info.md, std::move(key), digits));
    return Status();
}

std::string
HotpGenerator::generate(int64_t counter) const
{
    // Do HMAC(secret_, counter), with negative counters in two's complement:
    uint64_t c = static_cast<uint64_t>(counter);
    DataArray<8> cb =
    {{
        static_cast<uint8_t>(c >> 56),
        static_cast<uint8_t>(c >> 48),
        static_cast<uint8_t>(c >> 40),
        static_cast<uint8_t>(c >> 32),
        static_cast<uint8_t>(c >> 24),
        static_cast<uint8_t>(c >> 16),
        static_cast<uint8_t>(c >> 8),
        static_cast<uint8_t>(c)
    }};
    auto mac = hmac(md_, secret_, cb);

    // Calculate the truncated output:
    unsigned offset = mac.back() & 0xf;
    uint32_t p = (static_cast<uint32_t>(mac[offset]) << 24) |
        (static_cast<uint32_t>(mac[offset + 1]) << 16) |
        (static_cast<uint32_t>(mac[offset + 2]) << 8) |
        static_cast<uint32_t>(mac[offset + 3]);
    p &= 0x7fffffff;

    // Format as a fixed-width decimal number:
    std::stringstream ss;
    ss.width(digits_);
    ss.fill('0');
    ss << p % powersOfTen[digits_];
    return ss.str();
}

bool
HotpGenerator::validate(int64_t counter, const std::string &code) const
{
    auto expected = generate(counter);
    if (expected.size() != code.size())
        return false;
    return !CRYPTO_memcmp(expected.data(), code.data(), code.size());
}

} // namespace otpkit
