/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Hotp.hpp"
#include "OtpToken.hpp"
#include "OtpValidate.hpp"
#include "../util/Debug.hpp"
#include <limits>

namespace otpc {

Hotp::~Hotp()
{
    dataWipe(secret_);
}

Status
Hotp::create(std::shared_ptr<Hotp> &result, const HotpConfig &config)
{
    std::shared_ptr<Hotp> out(new Hotp());
    OTPC_CHECK(out->init(config));

    result = std::move(out);
    return Status();
}

Status
Hotp::init(const HotpConfig &config)
{
    OTPC_CHECK(otpValidateSecret(secret_, config.secret, config.algorithm));
    OTPC_CHECK(otpValidateAlgorithm(config.algorithm));
    OTPC_CHECK(otpValidateDigits(config.digits));
    OTPC_CHECK(otpValidateCounter(config.counter));

    algorithm_ = config.algorithm;
    digits_ = config.digits;
    counter_ = config.counter;
    return Status();
}

Status
Hotp::generate(OtpResult &result) const
{
    return generate(result, counter_);
}

Status
Hotp::generate(OtpResult &result, int64_t counter) const
{
    OTPC_CHECK(otpValidateCounter(counter));
    if (std::numeric_limits<int64_t>::max() == counter)
        return OTPC_ERROR(OTPC_CC_InvalidCounter,
            "Counter has no next value");

    OtpResult out;
    OTPC_CHECK(otpDerive(out.token, secret_, algorithm_, counter, digits_));
    out.nextCounter = counter + 1;

    result = std::move(out);
    return Status();
}

Status
Hotp::validate(ValidationResult &result, const std::string &token) const
{
    return validate(result, token, counter_);
}

Status
Hotp::validate(ValidationResult &result, const std::string &token,
    int64_t counter, unsigned lookAhead) const
{
    OTPC_CHECK(otpValidateToken(token, digits_));
    OTPC_CHECK(otpValidateCounter(counter));
    if (static_cast<unsigned>(std::numeric_limits<int>::max()) < lookAhead)
        return OTPC_ERROR(OTPC_CC_InvalidCounter, "Look-ahead is too large");
    if (std::numeric_limits<int64_t>::max() - counter < lookAhead)
        return OTPC_ERROR(OTPC_CC_InvalidCounter,
            "Counter look-ahead runs past the largest counter");

    for (int64_t i = 0; i <= lookAhead; ++i)
    {
        std::string expected;
        OTPC_CHECK(otpDerive(expected, secret_, algorithm_, counter + i,
            digits_));

        if (otpTokenEquals(token, expected))
        {
            if (i)
                OTPC_DebugLevel(1, "HOTP counter resynchronized by %d",
                    static_cast<int>(i));

            result = ValidationResult();
            result.isValid = true;
            result.delta = static_cast<int>(i);
            result.usedCounter = counter + i;
            return Status();
        }
    }

    OTPC_DebugLevel(1, "HOTP token rejected (look-ahead %u)", lookAhead);
    result = ValidationResult();
    return Status();
}

} // namespace otpc
