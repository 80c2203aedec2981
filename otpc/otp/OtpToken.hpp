/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPC_OTP_OTP_TOKEN_HPP
#define OTPC_OTP_OTP_TOKEN_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpc {

/**
 * Derives a token from a secret and a counter, as defined by rfc4226.
 * The result is exactly `digits` decimal characters, zero-padded.
 * Accepts at most 9 digits, but otherwise does no parameter checking
 * beyond what the truncation step needs.
 */
Status
otpDerive(std::string &result, DataSlice secret, tOTPC_Algorithm algorithm,
    uint64_t counter, unsigned digits);

/**
 * Performs the rfc4226 dynamic truncation of an HMAC digest,
 * producing a 31-bit value.
 */
Status
otpTruncate(uint32_t &result, DataSlice digest);

/**
 * Compares two tokens in time that does not depend on their contents.
 */
bool
otpTokenEquals(const std::string &a, const std::string &b);

} // namespace otpc

#endif
