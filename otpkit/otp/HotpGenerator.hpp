/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_OTP_HOTP_GENERATOR_HPP
#define OTPKIT_OTP_HOTP_GENERATOR_HPP

#include "OtpManager.hpp"
#include "../crypto/HashAlgorithm.hpp"
#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <memory>

namespace otpkit {

/**
 * Implements the counter-based HOTP algorithm defined by rfc4226,
 * with the SHA256 and SHA512 variants allowed by rfc6238.
 */
class HotpGenerator:
    public OtpManager
{
public:
    ~HotpGenerator();
    HotpGenerator(const HotpGenerator &copy) = default;

    /**
     * Validates the parameters and builds a generator.
     *
     * @param secret The HMAC key. Pass nullptr to generate a random key
     * of the algorithm's default size.
     * @param digits Code length, 1 to OTP_MAX_CODE_DIGITS.
     */
    static Status
    create(std::shared_ptr<HotpGenerator> &result, HashAlgorithm algorithm,
           const DataSlice *secret, int digits);

    HashAlgorithm algorithm() const { return algorithm_; }
    DataSlice secret() const { return secret_; }
    int digits() const { return digits_; }

    std::string
    generate(int64_t counter) const override;

    bool
    validate(int64_t counter, const std::string &code) const override;

private:
    HashAlgorithm algorithm_;
    const EVP_MD *md_;
    DataChunk secret_;
    int digits_;

    HotpGenerator(HashAlgorithm algorithm, const EVP_MD *md,
                  DataChunk secret, int digits);
};

} // namespace otpkit

#endif
