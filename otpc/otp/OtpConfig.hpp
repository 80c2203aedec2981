/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Configuration and result records shared by the TOTP and HOTP generators.
 */

#ifndef OTPC_OTP_OTP_CONFIG_HPP
#define OTPC_OTP_OTP_CONFIG_HPP

#include "../../src/OTPC.h"
#include <stdint.h>
#include <string>

namespace otpc {

/**
 * Settings for a time-based generator.
 * The secret is in base32 text form.
 */
struct TotpConfig
{
    std::string secret;
    tOTPC_Algorithm algorithm = OTPC_Algorithm_SHA1;
    int digits = 6;
    int period = 30;
};

/**
 * Settings for a counter-based generator.
 */
struct HotpConfig
{
    std::string secret;
    tOTPC_Algorithm algorithm = OTPC_Algorithm_SHA1;
    int digits = 6;
    int64_t counter = 0;
};

struct OtpResult
{
    std::string token;

    // TOTP only. Seconds until the token changes, between 1 and the period:
    int remainingTime = 0;

    // HOTP only. The counter to use for the next token:
    int64_t nextCounter = 0;
};

/**
 * The outcome of checking a token.
 * The delta and usedCounter fields are only meaningful when isValid is true.
 */
struct ValidationResult
{
    bool isValid = false;

    // The matching step, relative to the requested time or counter:
    int delta = 0;

    // The time step or counter that produced the matching token:
    int64_t usedCounter = 0;
};

} // namespace otpc

#endif
