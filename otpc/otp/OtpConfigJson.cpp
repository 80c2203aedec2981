/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpConfigJson.hpp"
#include "OtpAlgorithm.hpp"
#include <limits.h>

namespace otpc {

/**
 * Narrows a JSON integer. Out-of-range values become 0,
 * which neither the digit nor the period check accepts.
 */
static int
narrowInteger(json_int_t value)
{
    if (value < INT_MIN || INT_MAX < value)
        return 0;
    return static_cast<int>(value);
}

Status
OtpConfigJson::commonFields(std::string &secret, tOTPC_Algorithm &algorithm,
    int &digits) const
{
    if (!json_is_object(root_))
        return OTPC_ERROR(OTPC_CC_JSONError, "OTP configuration must be an object");

    if (!secretOk())
        return OTPC_ERROR(OTPC_CC_InvalidSecret,
            "Secret must be a non-empty string");

    if (hasKey("algorithm") && !algorithmOk())
        return OTPC_ERROR(OTPC_CC_InvalidAlgorithm,
            "Algorithm must be one of: SHA1, SHA256, SHA512");
    OTPC_CHECK(otpAlgorithmFromName(algorithm, this->algorithm()));

    if (hasKey("digits") && !digitsOk())
        return OTPC_ERROR(OTPC_CC_InvalidDigits,
            "Digits must be an integer between 6 and 8");

    secret = this->secret();
    digits = narrowInteger(this->digits());
    return Status();
}

Status
OtpConfigJson::totpConfig(TotpConfig &result) const
{
    TotpConfig out;
    OTPC_CHECK(commonFields(out.secret, out.algorithm, out.digits));

    if (hasKey("period") && !periodOk())
        return OTPC_ERROR(OTPC_CC_InvalidPeriod,
            "Period must be a positive integer");
    out.period = narrowInteger(period());

    result = std::move(out);
    return Status();
}

Status
OtpConfigJson::hotpConfig(HotpConfig &result) const
{
    HotpConfig out;
    OTPC_CHECK(commonFields(out.secret, out.algorithm, out.digits));

    if (hasKey("counter") && !counterOk())
        return OTPC_ERROR(OTPC_CC_InvalidCounter,
            "Counter must be a non-negative integer");
    out.counter = counter();

    result = std::move(out);
    return Status();
}

} // namespace otpc
