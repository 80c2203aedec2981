/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Parameter checks run before any token is derived.
 * Each check inspects its input and reports a specific condition code.
 */

#ifndef OTPC_OTP_OTP_VALIDATE_HPP
#define OTPC_OTP_OTP_VALIDATE_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpc {

/**
 * Decodes a base32 secret and checks it has the length the algorithm needs.
 * The length check is skipped for unknown algorithms,
 * leaving that problem for otpValidateAlgorithm to report.
 */
Status
otpValidateSecret(DataChunk &result, const std::string &secret,
    tOTPC_Algorithm algorithm);

Status
otpValidateAlgorithm(tOTPC_Algorithm algorithm);

Status
otpValidateDigits(int digits);

Status
otpValidatePeriod(int period);

Status
otpValidateCounter(int64_t counter);

/**
 * Checks that a user-supplied token is a string of exactly `digits` digits.
 */
Status
otpValidateToken(const std::string &token, int digits);

} // namespace otpc

#endif
