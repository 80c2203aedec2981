/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPC_OTP_TOTP_HPP
#define OTPC_OTP_TOTP_HPP

#include "OtpConfig.hpp"
#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <memory>

namespace otpc {

/**
 * Returns the current wall-clock time in milliseconds since the epoch.
 */
int64_t
otpNowMillis();

/**
 * Implements the TOTP algorithm defined by rfc6238.
 * Instances are immutable once created, so they can be shared between threads.
 */
class Totp
{
public:
    ~Totp();

    /**
     * Checks the configuration and builds a generator from it.
     */
    static Status
    create(std::shared_ptr<Totp> &result, const TotpConfig &config);

    /**
     * Converts a millisecond timestamp to a time step,
     * rounding towards negative infinity.
     */
    static int64_t
    timeStep(int64_t nowMillis, int period);

    tOTPC_Algorithm algorithm() const { return algorithm_; }
    int digits() const { return digits_; }
    int period() const { return period_; }

    /**
     * Produces the token for the current time.
     */
    Status
    generate(OtpResult &result) const;

    /**
     * Produces the token for the given time.
     */
    Status
    generate(OtpResult &result, int64_t nowMillis) const;

    /**
     * Checks a token against the current time, allowing one step of drift.
     */
    Status
    validate(ValidationResult &result, const std::string &token) const;

    /**
     * Checks a token against the given time.
     * Tries the steps from -window to +window, in that order,
     * and reports the first one that matches.
     * A malformed token is an error, but a wrong token is not.
     */
    Status
    validate(ValidationResult &result, const std::string &token,
        int64_t nowMillis, unsigned window=OTPC_DEFAULT_WINDOW) const;

    /**
     * Returns the time step for the current time.
     */
    int64_t
    currentTimeStep() const;

    int64_t
    currentTimeStep(int64_t nowMillis) const;

private:
    DataChunk secret_;
    tOTPC_Algorithm algorithm_;
    int digits_;
    int period_;

    Totp() {}

    Status
    init(const TotpConfig &config);

    Status
    tokenAt(std::string &result, int64_t counter) const;
};

} // namespace otpc

#endif
