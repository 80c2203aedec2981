/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OTPC.h"
#include "../otpc/otp/Hotp.hpp"
#include "../otpc/otp/OtpSecret.hpp"
#include "../otpc/otp/OtpValidate.hpp"
#include "../otpc/otp/Totp.hpp"
#include "../otpc/util/Debug.hpp"
#include "../otpc/util/Util.hpp"

using namespace otpc;

#define OTPC_PROLOG() \
    OTPC_DebugLog("%s called", __FUNCTION__); \
    tOTPC_CC cc = OTPC_CC_Ok; \
    OTPC_SET_ERR_CODE(pError, OTPC_CC_Ok);

#define OTPC_GET_TOTP() \
    std::shared_ptr<Totp> totp; \
    { \
        TotpConfig config; \
        config.secret = szSecret; \
        config.algorithm = algorithm; \
        config.digits = digits; \
        config.period = period; \
        OTPC_CHECK_NEW(Totp::create(totp, config)); \
    }

#define OTPC_GET_HOTP() \
    std::shared_ptr<Hotp> hotp; \
    { \
        HotpConfig config; \
        config.secret = szSecret; \
        config.algorithm = algorithm; \
        config.digits = digits; \
        config.counter = counter; \
        OTPC_CHECK_NEW(Hotp::create(hotp, config)); \
    }

tOTPC_CC OTPC_Initialize(const char *szLogPath,
                         tOTPC_Error *pError)
{
    OTPC_PROLOG();
    OTPC_CHECK_NULL(pError);

    OTPC_CHECK_NEW(debugInitialize(szLogPath ? szLogPath : ""));

exit:
    return cc;
}

/**
 * Mark the end of use of the otpcore library.
 *
 * This function is the counter to OTPC_Initialize.
 */
void OTPC_Terminate()
{
    debugTerminate();
}

void OTPC_FreeStr(char *sz)
{
    stringFree(sz);
}

tOTPC_CC OTPC_GenerateSecret(unsigned int length,
                             char **pszSecret,
                             tOTPC_Error *pError)
{
    OTPC_PROLOG();
    OTPC_CHECK_NULL(pError);
    OTPC_CHECK_NULL(pszSecret);

    {
        std::string secret;
        OTPC_CHECK_NEW(otpSecretGenerate(secret, length));
        *pszSecret = stringCopy(secret);
        OTPC_UtilGuaranteedMemset(&secret[0], 0, secret.size());
    }

exit:
    return cc;
}

tOTPC_CC OTPC_TotpGenerate(const char *szSecret,
                           tOTPC_Algorithm algorithm,
                           int digits,
                           int period,
                           const int64_t *pNowMillis,
                           char **pszToken,
                           int *pRemainingTime,
                           tOTPC_Error *pError)
{
    OTPC_PROLOG();
    OTPC_CHECK_NULL(pError);
    OTPC_CHECK_NULL(szSecret);
    OTPC_CHECK_NULL(pszToken);

    {
        OTPC_GET_TOTP();

        OtpResult result;
        if (pNowMillis)
            OTPC_CHECK_NEW(totp->generate(result, *pNowMillis));
        else
            OTPC_CHECK_NEW(totp->generate(result));

        *pszToken = stringCopy(result.token);
        if (pRemainingTime)
            *pRemainingTime = result.remainingTime;
    }

exit:
    return cc;
}

tOTPC_CC OTPC_TotpValidate(const char *szSecret,
                           tOTPC_Algorithm algorithm,
                           int digits,
                           int period,
                           const char *szToken,
                           const int64_t *pNowMillis,
                           unsigned int window,
                           bool *pbValid,
                           int *pDelta,
                           tOTPC_Error *pError)
{
    OTPC_PROLOG();
    OTPC_CHECK_NULL(pError);
    OTPC_CHECK_NULL(szSecret);
    OTPC_CHECK_NULL(szToken);
    OTPC_CHECK_NULL(pbValid);

    {
        OTPC_GET_TOTP();

        ValidationResult result;
        OTPC_CHECK_NEW(totp->validate(result, szToken,
            pNowMillis ? *pNowMillis : otpNowMillis(), window));

        *pbValid = result.isValid;
        if (pDelta)
            *pDelta = result.delta;
    }

exit:
    return cc;
}

tOTPC_CC OTPC_TotpTimeStep(int period,
                           const int64_t *pNowMillis,
                           int64_t *pTimeStep,
                           tOTPC_Error *pError)
{
    OTPC_PROLOG();
    OTPC_CHECK_NULL(pError);
    OTPC_CHECK_NULL(pTimeStep);

    OTPC_CHECK_NEW(otpValidatePeriod(period));
    *pTimeStep = Totp::timeStep(pNowMillis ? *pNowMillis : otpNowMillis(),
        period);

exit:
    return cc;
}

tOTPC_CC OTPC_HotpGenerate(const char *szSecret,
                           tOTPC_Algorithm algorithm,
                           int digits,
                           int64_t counter,
                           char **pszToken,
                           tOTPC_Error *pError)
{
    OTPC_PROLOG();
    OTPC_CHECK_NULL(pError);
    OTPC_CHECK_NULL(szSecret);
    OTPC_CHECK_NULL(pszToken);

    {
        OTPC_GET_HOTP();

        OtpResult result;
        OTPC_CHECK_NEW(hotp->generate(result));
        *pszToken = stringCopy(result.token);
    }

exit:
    return cc;
}

tOTPC_CC OTPC_HotpValidate(const char *szSecret,
                           tOTPC_Algorithm algorithm,
                           int digits,
                           const char *szToken,
                           int64_t counter,
                           unsigned int lookAhead,
                           bool *pbValid,
                           int64_t *pUsedCounter,
                           tOTPC_Error *pError)
{
    OTPC_PROLOG();
    OTPC_CHECK_NULL(pError);
    OTPC_CHECK_NULL(szSecret);
    OTPC_CHECK_NULL(szToken);
    OTPC_CHECK_NULL(pbValid);

    {
        OTPC_GET_HOTP();

        ValidationResult result;
        OTPC_CHECK_NEW(hotp->validate(result, szToken, counter, lookAhead));

        *pbValid = result.isValid;
        if (pUsedCounter)
            *pUsedCounter = result.usedCounter;
    }

exit:
    return cc;
}
