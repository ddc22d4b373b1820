/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_CRYPTO_HASH_ALGORITHM_HPP
#define OTPKIT_CRYPTO_HASH_ALGORITHM_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <openssl/evp.h>

namespace otpkit {

/**
 * The hash functions usable for the HMAC step of HOTP / TOTP.
 */
enum class HashAlgorithm
{
    SHA1,
    SHA256,
    SHA512
};

/**
 * Everything the OTP engines need to know about a hash algorithm.
 */
struct HashAlgorithmInfo
{
    const EVP_MD *md;
    size_t defaultKeySize;
    const char *name;
};

/**
 * Looks up the properties of a hash algorithm.
 * Fails with OTP_CC_UnknownAlgorithm for values outside the enumeration.
 */
Status
hashAlgorithmInfo(HashAlgorithmInfo &result, HashAlgorithm algorithm);

/**
 * The recommended secret length in bytes (20, 32 or 64).
 */
Status
hashAlgorithmDefaultKeySize(size_t &result, HashAlgorithm algorithm);

/**
 * Parses "SHA1", "SHA256" or "SHA512", ignoring case.
 */
Status
hashAlgorithmFromName(HashAlgorithm &result, const std::string &name);

/**
 * Returns the canonical name, or "unknown" for invalid values.
 */
const char *
hashAlgorithmName(HashAlgorithm algorithm);

/**
 * Computes an HMAC over `data` with the given digest.
 * The output size is the digest size.
 * OpenSSL only fails here when it cannot set up the digest context,
 * which is reported as std::runtime_error.
 */
DataChunk
hmac(const EVP_MD *md, DataSlice key, DataSlice data);

} // namespace otpkit

#endif
