/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef OTPC_UTIL_STATUS_HPP
#define OTPC_UTIL_STATUS_HPP

// We need tOTPC_CC and tOTPC_Error:
#include "../../src/OTPC.h"
#include <ostream>
#include <string>

namespace otpc {

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tOTPC_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tOTPC_CC value()            const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == OTPC_CC_Ok; }

    /**
     * Write this status to the debug log if it represents an error.
     */
    const Status &log() const;

    /**
     * Unpacks this status into a tOTPC_Error structure.
     */
    void toError(tOTPC_Error &error) const;

private:
    // Error information:
    tOTPC_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define OTPC_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define OTPC_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

/**
 * Use when an old-style C API function calls a new-style otpc::Status function.
 */
#define OTPC_CHECK_NEW(f) \
    do { \
        Status s = (f); \
        if (!s) { \
            s.log().toError(*pError); \
            cc = s.value(); \
            goto exit; \
        } \
    } while (false)

} // namespace otpc

#endif
