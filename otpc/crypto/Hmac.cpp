/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Hmac.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace otpc {

static const EVP_MD *
hmacHashFunction(tOTPC_Algorithm algorithm)
{
    switch (algorithm)
    {
    case OTPC_Algorithm_SHA1:
        return EVP_sha1();
    case OTPC_Algorithm_SHA256:
        return EVP_sha256();
    case OTPC_Algorithm_SHA512:
        return EVP_sha512();
    default:
        return nullptr;
    }
}

Status
hmacDigest(DataChunk &result, tOTPC_Algorithm algorithm,
    DataSlice key, DataSlice data)
{
    const EVP_MD *md = hmacHashFunction(algorithm);
    if (!md)
        return OTPC_ERROR(OTPC_CC_InvalidAlgorithm, "Unknown HMAC hash function");

    DataArray<EVP_MAX_MD_SIZE> hmac;
    unsigned size = 0;
    if (!HMAC(md, key.data(), key.size(), data.data(), data.size(),
        hmac.data(), &size))
        return OTPC_ERROR(OTPC_CC_SysError, "HMAC calculation failed");

    result = DataChunk(hmac.begin(), hmac.begin() + size);
    return Status();
}

} // namespace otpc
