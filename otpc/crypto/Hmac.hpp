/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPC_CRYPTO_HMAC_HPP
#define OTPC_CRYPTO_HMAC_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpc {

/**
 * Computes HMAC(key, data) using the requested hash function.
 * The digest is 20, 32, or 64 bytes long depending on the algorithm.
 */
Status
hmacDigest(DataChunk &result, tOTPC_Algorithm algorithm,
    DataSlice key, DataSlice data);

} // namespace otpc

#endif
