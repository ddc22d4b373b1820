/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPKIT_CRYPTO_RANDOM_HPP
#define OTPKIT_CRYPTO_RANDOM_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpkit {

/**
 * Fills a buffer with `size` bytes from the system's
 * cryptographically-secure random source.
 */
Status
randomData(DataChunk &result, size_t size);

} // namespace otpkit

#endif
