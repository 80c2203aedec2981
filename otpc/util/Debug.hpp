/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPC_UTIL_DEBUG_HPP
#define OTPC_UTIL_DEBUG_HPP

#include "Status.hpp"

#define DEBUG_LEVEL 1

#define OTPC_DebugLevel(level, ...)  \
{                                    \
    if (DEBUG_LEVEL >= level)        \
    {                                \
        OTPC_DebugLog(__VA_ARGS__);  \
    }                                \
}

namespace otpc {

/**
 * Opens the log file. An empty path logs to stdout only.
 */
Status
debugInitialize(const std::string &logPath);

void
debugTerminate();

void OTPC_DebugLog(const char *format, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace otpc

#endif
