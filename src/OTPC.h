/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * otpcore public API. Applications only call functions found in this file.
 */

#ifndef OTPC_h
#define OTPC_h

#include <stdbool.h>
#include <stdint.h>

/** The maximum buffer length for default strings in the system */
#define OTPC_MAX_STRING_LENGTH 256

/** Secret sizes, in bytes, mandated by each hash algorithm. */
#define OTPC_SECRET_LENGTH_SHA1     20
#define OTPC_SECRET_LENGTH_SHA256   32
#define OTPC_SECRET_LENGTH_SHA512   64

/** Allowed range for the number of token digits. */
#define OTPC_MIN_DIGITS 6
#define OTPC_MAX_DIGITS 8

/** Default number of time steps accepted on either side of "now". */
#define OTPC_DEFAULT_WINDOW 1

#ifdef __cplusplus
extern "C" {
#endif

/**
 * otpcore Condition Codes
 *
 * All otpcore functions return this code.
 * OTPC_CC_Ok indicates that there was no issue.
 * All other values indication some issue.
 */
typedef enum eOTPC_CC
{
    /** The function completed without an error */
    OTPC_CC_Ok = 0,
    /** An error occured */
    OTPC_CC_Error = 1,
    /** Unexpected NULL pointer */
    OTPC_CC_NULLPtr = 2,
    /** A system or library call failed */
    OTPC_CC_SysError = 3,
    /** JSON parsing error */
    OTPC_CC_JSONError = 4,
    /** The shared secret is missing, malformed, or the wrong length */
    OTPC_CC_InvalidSecret = 5,
    /** The hash algorithm is not supported */
    OTPC_CC_InvalidAlgorithm = 6,
    /** The digit count is outside the allowed range */
    OTPC_CC_InvalidDigits = 7,
    /** The time step period is not a positive number */
    OTPC_CC_InvalidPeriod = 8,
    /** The counter is negative */
    OTPC_CC_InvalidCounter = 9,
    /** The token is empty, non-numeric, or the wrong length */
    OTPC_CC_InvalidToken = 10,
    /** Reserved for callers. Validation reports this case as "not valid". */
    OTPC_CC_ExpiredToken = 11,
    /** The HMAC digest could not be truncated */
    OTPC_CC_DerivationError = 12
} tOTPC_CC;

/**
 * otpcore Error Structure
 *
 * This structure contains the detailed information associated
 * with an error.
 */
typedef struct sOTPC_Error
{
    /** The condition code code */
    tOTPC_CC code;
    /** String containing a description of the error */
    char szDescription[OTPC_MAX_STRING_LENGTH + 1];
    /** String containing the function in which the error occurred */
    char szSourceFunc[OTPC_MAX_STRING_LENGTH + 1];
    /** String containing the source file in which the error occurred */
    char szSourceFile[OTPC_MAX_STRING_LENGTH + 1];
    /** Line number in the source file in which the error occurred */
    int  nSourceLine;
} tOTPC_Error;

/**
 * HMAC hash functions usable for token derivation.
 */
typedef enum eOTPC_Algorithm
{
    OTPC_Algorithm_SHA1 = 0,
    OTPC_Algorithm_SHA256,
    OTPC_Algorithm_SHA512,
    OTPC_Algorithm_Count
} tOTPC_Algorithm;

tOTPC_CC OTPC_Initialize(const char *szLogPath,
                         tOTPC_Error *pError);

void OTPC_Terminate();

void OTPC_FreeStr(char *sz);

tOTPC_CC OTPC_GenerateSecret(unsigned int length,
                             char **pszSecret,
                             tOTPC_Error *pError);

tOTPC_CC OTPC_TotpGenerate(const char *szSecret,
                           tOTPC_Algorithm algorithm,
                           int digits,
                           int period,
                           const int64_t *pNowMillis,
                           char **pszToken,
                           int *pRemainingTime,
                           tOTPC_Error *pError);

tOTPC_CC OTPC_TotpValidate(const char *szSecret,
                           tOTPC_Algorithm algorithm,
                           int digits,
                           int period,
                           const char *szToken,
                           const int64_t *pNowMillis,
                           unsigned int window,
                           bool *pbValid,
                           int *pDelta,
                           tOTPC_Error *pError);

tOTPC_CC OTPC_TotpTimeStep(int period,
                           const int64_t *pNowMillis,
                           int64_t *pTimeStep,
                           tOTPC_Error *pError);

tOTPC_CC OTPC_HotpGenerate(const char *szSecret,
                           tOTPC_Algorithm algorithm,
                           int digits,
                           int64_t counter,
                           char **pszToken,
                           tOTPC_Error *pError);

tOTPC_CC OTPC_HotpValidate(const char *szSecret,
                           tOTPC_Algorithm algorithm,
                           int digits,
                           const char *szToken,
                           int64_t counter,
                           unsigned int lookAhead,
                           bool *pbValid,
                           int64_t *pUsedCounter,
                           tOTPC_Error *pError);

#ifdef __cplusplus
}
#endif

#endif
