/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Random.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>

namespace otpc {

Status
randomData(DataChunk &result, size_t size)
{
    DataChunk out;
    out.resize(size);

    if (!RAND_bytes(out.data(), out.size()))
        return OTPC_ERROR(OTPC_CC_SysError, "Random data generation failed: " +
            std::to_string(ERR_get_error()));

    result = std::move(out);
    return Status();
}

} // namespace otpc
