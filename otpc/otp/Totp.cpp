/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Totp.hpp"
#include "OtpToken.hpp"
#include "OtpValidate.hpp"
#include "../util/Debug.hpp"
#include <chrono>
#include <limits>

namespace otpc {

int64_t
otpNowMillis()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
}

/**
 * Integer division that rounds towards negative infinity.
 * The divisor must be positive.
 */
static int64_t
floorDivide(int64_t value, int64_t divisor)
{
    int64_t out = value / divisor;
    if (value % divisor < 0)
        --out;
    return out;
}

Totp::~Totp()
{
    dataWipe(secret_);
}

Status
Totp::create(std::shared_ptr<Totp> &result, const TotpConfig &config)
{
    std::shared_ptr<Totp> out(new Totp());
    OTPC_CHECK(out->init(config));

    result = std::move(out);
    return Status();
}

Status
Totp::init(const TotpConfig &config)
{
    OTPC_CHECK(otpValidateSecret(secret_, config.secret, config.algorithm));
    OTPC_CHECK(otpValidateAlgorithm(config.algorithm));
    OTPC_CHECK(otpValidateDigits(config.digits));
    OTPC_CHECK(otpValidatePeriod(config.period));

    algorithm_ = config.algorithm;
    digits_ = config.digits;
    period_ = config.period;
    return Status();
}

int64_t
Totp::timeStep(int64_t nowMillis, int period)
{
    return floorDivide(nowMillis, 1000 * static_cast<int64_t>(period));
}

Status
Totp::generate(OtpResult &result) const
{
    return generate(result, otpNowMillis());
}

Status
Totp::generate(OtpResult &result, int64_t nowMillis) const
{
    const int64_t periodMillis = 1000 * static_cast<int64_t>(period_);
    const int64_t counter = timeStep(nowMillis, period_);

    OtpResult out;
    OTPC_CHECK(tokenAt(out.token, counter));

    // Round the partial second up:
    int64_t elapsed = nowMillis - counter * periodMillis;
    out.remainingTime = (periodMillis - elapsed + 999) / 1000;

    result = std::move(out);
    return Status();
}

Status
Totp::validate(ValidationResult &result, const std::string &token) const
{
    return validate(result, token, otpNowMillis());
}

Status
Totp::validate(ValidationResult &result, const std::string &token,
    int64_t nowMillis, unsigned window) const
{
    OTPC_CHECK(otpValidateToken(token, digits_));
    if (static_cast<unsigned>(std::numeric_limits<int>::max()) < window)
        return OTPC_ERROR(OTPC_CC_Error, "Validation window is too large");

    const int64_t base = timeStep(nowMillis, period_);
    const int64_t range = window;
    for (int64_t i = -range; i <= range; ++i)
    {
        std::string expected;
        OTPC_CHECK(tokenAt(expected, base + i));

        if (otpTokenEquals(token, expected))
        {
            if (i)
                OTPC_DebugLevel(1, "TOTP token accepted with clock drift %d",
                    static_cast<int>(i));

            result = ValidationResult();
            result.isValid = true;
            result.delta = static_cast<int>(i);
            result.usedCounter = base + i;
            return Status();
        }
    }

    OTPC_DebugLevel(1, "TOTP token rejected (window %u)", window);
    result = ValidationResult();
    return Status();
}

int64_t
Totp::currentTimeStep() const
{
    return currentTimeStep(otpNowMillis());
}

int64_t
Totp::currentTimeStep(int64_t nowMillis) const
{
    return timeStep(nowMillis, period_);
}

Status
Totp::tokenAt(std::string &result, int64_t counter) const
{
    OTPC_CHECK(otpValidateCounter(counter));
    return otpDerive(result, secret_, algorithm_, counter, digits_);
}

} // namespace otpc
