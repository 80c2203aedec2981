/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpAlgorithm.hpp"
#include <strings.h>

namespace otpc {

struct AlgorithmRow
{
    tOTPC_Algorithm algorithm;
    const char *name;
    size_t secretLength;
};

static const AlgorithmRow algorithmTable[] =
{
    {OTPC_Algorithm_SHA1,   "SHA1",   OTPC_SECRET_LENGTH_SHA1},
    {OTPC_Algorithm_SHA256, "SHA256", OTPC_SECRET_LENGTH_SHA256},
    {OTPC_Algorithm_SHA512, "SHA512", OTPC_SECRET_LENGTH_SHA512}
};

const char *
otpAlgorithmName(tOTPC_Algorithm algorithm)
{
    for (const auto &row: algorithmTable)
        if (row.algorithm == algorithm)
            return row.name;
    return "unknown";
}

size_t
otpAlgorithmSecretLength(tOTPC_Algorithm algorithm)
{
    for (const auto &row: algorithmTable)
        if (row.algorithm == algorithm)
            return row.secretLength;
    return 0;
}

Status
otpAlgorithmFromName(tOTPC_Algorithm &result, const std::string &name)
{
    for (const auto &row: algorithmTable)
    {
        if (!strcasecmp(row.name, name.c_str()))
        {
            result = row.algorithm;
            return Status();
        }
    }

    return OTPC_ERROR(OTPC_CC_InvalidAlgorithm,
        "Algorithm must be one of: SHA1, SHA256, SHA512");
}

} // namespace otpc
