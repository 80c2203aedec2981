/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPC_OTP_HOTP_HPP
#define OTPC_OTP_HOTP_HPP

#include "OtpConfig.hpp"
#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <memory>

namespace otpc {

/**
 * Implements the HOTP algorithm defined by rfc4226.
 * The generator does not advance its counter;
 * keeping track of the next counter is up to the caller.
 */
class Hotp
{
public:
    ~Hotp();

    static Status
    create(std::shared_ptr<Hotp> &result, const HotpConfig &config);

    tOTPC_Algorithm algorithm() const { return algorithm_; }
    int digits() const { return digits_; }
    int64_t counter() const { return counter_; }

    /**
     * Produces the token for the configured counter.
     */
    Status
    generate(OtpResult &result) const;

    Status
    generate(OtpResult &result, int64_t counter) const;

    /**
     * Checks a token against the configured counter only.
     */
    Status
    validate(ValidationResult &result, const std::string &token) const;

    /**
     * Checks a token against `counter`, and then against up to
     * `lookAhead` following counters for resynchronization.
     */
    Status
    validate(ValidationResult &result, const std::string &token,
        int64_t counter, unsigned lookAhead=0) const;

private:
    DataChunk secret_;
    tOTPC_Algorithm algorithm_;
    int digits_;
    int64_t counter_;

    Hotp() {}

    Status
    init(const HotpConfig &config);
};

} // namespace otpc

#endif
