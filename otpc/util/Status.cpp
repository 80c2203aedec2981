/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#include "Status.hpp"
#include "Debug.hpp"
#include <sstream>
#include <string.h>

namespace otpc {

Status::Status() :
    value_(OTPC_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tOTPC_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        std::stringstream ss;
        ss << *this;
        OTPC_DebugLog("%s", ss.str().c_str());
    }
    return *this;
}

void Status::toError(tOTPC_Error &error) const
{
    error.code = value_;
    strncpy(error.szDescription, message_.c_str(), OTPC_MAX_STRING_LENGTH);
    strncpy(error.szSourceFunc, function_, OTPC_MAX_STRING_LENGTH);
    strncpy(error.szSourceFile, file_, OTPC_MAX_STRING_LENGTH);
    error.nSourceLine = line_;

    error.szDescription[OTPC_MAX_STRING_LENGTH] = 0;
    error.szSourceFunc[OTPC_MAX_STRING_LENGTH] = 0;
    error.szSourceFile[OTPC_MAX_STRING_LENGTH] = 0;
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() << " (" << s.message() << ")";
    return output;
}

} // namespace otpc
