/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPC_OTP_OTP_CONFIG_JSON_HPP
#define OTPC_OTP_OTP_CONFIG_JSON_HPP

#include "OtpConfig.hpp"
#include "../json/JsonObject.hpp"

namespace otpc {

/**
 * A generator configuration record in JSON form:
 * {"secret": "...", "algorithm": "SHA1", "digits": 6, "period": 30}
 * The "period" key applies to TOTP and "counter" to HOTP.
 */
class OtpConfigJson:
    public JsonObject
{
public:
    OTPC_JSON_CONSTRUCTORS(OtpConfigJson, JsonObject)
    OTPC_JSON_STRING(secret, "secret", nullptr)
    OTPC_JSON_STRING(algorithm, "algorithm", "SHA1")
    OTPC_JSON_INTEGER(digits, "digits", 6)
    OTPC_JSON_INTEGER(period, "period", 30)
    OTPC_JSON_INTEGER(counter, "counter", 0)

    /**
     * Reads the record as a time-based configuration.
     * Only the field types are checked here; the values are checked
     * when the generator is created.
     */
    Status
    totpConfig(TotpConfig &result) const;

    /**
     * Reads the record as a counter-based configuration.
     */
    Status
    hotpConfig(HotpConfig &result) const;

private:
    Status
    commonFields(std::string &secret, tOTPC_Algorithm &algorithm,
        int &digits) const;
};

} // namespace otpc

#endif
