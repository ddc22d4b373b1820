/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Random.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <limits.h>

namespace otpkit {

Status
randomData(DataChunk &result, size_t size)
{
    if (INT_MAX < size)
        return OTP_ERROR(OTP_CC_RandomSourceError,
                         "Random data request too large");

    DataChunk out(size);
    if (1 != RAND_bytes(out.data(), static_cast<int>(out.size())))
    {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        return OTP_ERROR(OTP_CC_RandomSourceError,
                         std::string("Random data generation failed: ") + reason);
    }

    result = std::move(out);
    return Status();
}

} // namespace otpkit
