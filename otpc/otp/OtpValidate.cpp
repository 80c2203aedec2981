/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpValidate.hpp"
#include "OtpAlgorithm.hpp"
#include "OtpSecret.hpp"
#include <algorithm>

namespace otpc {

Status
otpValidateSecret(DataChunk &result, const std::string &secret,
    tOTPC_Algorithm algorithm)
{
    DataChunk out;
    OTPC_CHECK(otpSecretDecode(out, secret));

    size_t length = otpAlgorithmSecretLength(algorithm);
    if (length && out.size() != length)
    {
        dataWipe(out);
        return OTPC_ERROR(OTPC_CC_InvalidSecret,
            "Secret must be " + std::to_string(length) + " bytes long for " +
            otpAlgorithmName(algorithm) + " algorithm");
    }

    result = std::move(out);
    return Status();
}

Status
otpValidateAlgorithm(tOTPC_Algorithm algorithm)
{
    int value = algorithm;
    if (value < 0 || OTPC_Algorithm_Count <= value)
        return OTPC_ERROR(OTPC_CC_InvalidAlgorithm,
            "Algorithm must be one of: SHA1, SHA256, SHA512");
    return Status();
}

Status
otpValidateDigits(int digits)
{
    if (digits < OTPC_MIN_DIGITS || OTPC_MAX_DIGITS < digits)
        return OTPC_ERROR(OTPC_CC_InvalidDigits,
            "Digits must be an integer between 6 and 8");
    return Status();
}

Status
otpValidatePeriod(int period)
{
    if (period <= 0)
        return OTPC_ERROR(OTPC_CC_InvalidPeriod,
            "Period must be a positive integer");
    return Status();
}

Status
otpValidateCounter(int64_t counter)
{
    if (counter < 0)
        return OTPC_ERROR(OTPC_CC_InvalidCounter,
            "Counter must be a non-negative integer");
    return Status();
}

Status
otpValidateToken(const std::string &token, int digits)
{
    if (token.empty())
        return OTPC_ERROR(OTPC_CC_InvalidToken,
            "Token must be a non-empty string");

    if (!std::all_of(token.begin(), token.end(),
        [](char c){ return '0' <= c && c <= '9'; }))
        return OTPC_ERROR(OTPC_CC_InvalidToken,
            "Token must contain only digits");

    if (token.size() != static_cast<size_t>(digits))
        return OTPC_ERROR(OTPC_CC_InvalidToken,
            "Token must be exactly " + std::to_string(digits) +
            " digits long");

    return Status();
}

} // namespace otpc
