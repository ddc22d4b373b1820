/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "HashAlgorithm.hpp"
#include <openssl/hmac.h>
#include <strings.h>
#include <stdexcept>

namespace otpkit {

Status
hashAlgorithmInfo(HashAlgorithmInfo &result, HashAlgorithm algorithm)
{
    switch (algorithm)
    {
    case HashAlgorithm::SHA1:
        result = HashAlgorithmInfo{EVP_sha1(), 20, "SHA1"};
        return Status();
    case HashAlgorithm::SHA256:
        result = HashAlgorithmInfo{EVP_sha256(), 32, "SHA256"};
        return Status();
    case HashAlgorithm::SHA512:
        result = HashAlgorithmInfo{EVP_sha512(), 64, "SHA512"};
        return Status();
    }
    return OTP_ERROR(OTP_CC_UnknownAlgorithm, "Unknown hash algorithm");
}

Status
hashAlgorithmDefaultKeySize(size_t &result, HashAlgorithm algorithm)
{
    HashAlgorithmInfo info;
    OTP_CHECK(hashAlgorithmInfo(info, algorithm));
    result = info.defaultKeySize;
    return Status();
}

Status
hashAlgorithmFromName(HashAlgorithm &result, const std::string &name)
{
    const HashAlgorithm all[] =
    {
        HashAlgorithm::SHA1, HashAlgorithm::SHA256, HashAlgorithm::SHA512
    };
    for (auto algorithm: all)
    {
        if (!strcasecmp(name.c_str(), hashAlgorithmName(algorithm)))
        {
            result = algorithm;
            return Status();
        }
    }
    return OTP_ERROR(OTP_CC_UnknownAlgorithm,
                     "Unknown hash algorithm " + name);
}

const char *
hashAlgorithmName(HashAlgorithm algorithm)
{
    HashAlgorithmInfo info;
    if (!hashAlgorithmInfo(info, algorithm))
        return "unknown";
    return info.name;
}

DataChunk
hmac(const EVP_MD *md, DataSlice key, DataSlice data)
{
    DataChunk out(EVP_MAX_MD_SIZE);
    unsigned size = 0;
    if (!HMAC(md, key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), out.data(), &size))
        throw std::runtime_error("HMAC computation failed");
    out.resize(size);
    return out;
}

} // namespace otpkit
