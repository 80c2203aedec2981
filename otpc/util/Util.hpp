/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Helpers shared by the C API and the core.
 */

#ifndef OTPC_UTIL_UTIL_HPP
#define OTPC_UTIL_UTIL_HPP

#include "Debug.hpp"
#include <string.h>
#include <string>

namespace otpc {

#ifdef DEBUG
#define OTPC_LOG_ERROR(code, err_string) \
    { \
        OTPC_DebugLog("Error: %s, code: %d, func: %s, source: %s, line: %d", err_string, code, __FUNCTION__, __FILE__, __LINE__); \
    }
#else
    #define OTPC_LOG_ERROR(code, err_string) { }
#endif

#define OTPC_SET_ERR_CODE(err, set_code) \
    if (err != NULL) { \
        err->code = set_code; \
    }

#define OTPC_RET_ERROR(err, desc) \
    { \
        if (pError) \
        { \
            pError->code = err; \
            strcpy(pError->szDescription, desc); \
            strcpy(pError->szSourceFunc, __FUNCTION__); \
            strcpy(pError->szSourceFile, __FILE__); \
            pError->nSourceLine = __LINE__; \
        } \
        cc = err; \
        OTPC_LOG_ERROR(cc, desc); \
        goto exit; \
    }

#define OTPC_CHECK_ASSERT(assert, err, desc) \
    { \
        if (!(assert)) \
        { \
            OTPC_RET_ERROR(err, desc); \
        } \
    } \

#define OTPC_CHECK_NULL(arg) \
    { \
        OTPC_CHECK_ASSERT(arg != NULL, OTPC_CC_NULLPtr, "NULL pointer"); \
    } \

/**
 * Frees a C string, wiping its contents first.
 */
void
stringFree(char *string);

/**
 * Copies a string into a malloc'ed buffer the C API can hand out.
 */
char *
stringCopy(const char *string);

char *
stringCopy(const std::string &string);

/**
 * Sets memory in a way the optimizer cannot remove.
 */
void *OTPC_UtilGuaranteedMemset(void *v, int c, size_t n);

} // namespace otpc

#endif
