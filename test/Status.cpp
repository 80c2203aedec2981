/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpc/util/Status.hpp"
#include <catch2/catch.hpp>
#include <sstream>

using otpc::Status;

static Status
failingCall()
{
    return OTPC_ERROR(OTPC_CC_InvalidToken, "Token must contain only digits");
}

static Status
checkedCall()
{
    OTPC_CHECK(failingCall());
    return Status();
}

TEST_CASE("Status propagation", "[util][status]")
{
    REQUIRE(Status());
    REQUIRE(Status().value() == OTPC_CC_Ok);

    Status s = checkedCall();
    REQUIRE_FALSE(s);
    REQUIRE(s.value() == OTPC_CC_InvalidToken);
    REQUIRE(s.function() == "failingCall");
}

TEST_CASE("Status conversion to the C error structure", "[util][status]")
{
    tOTPC_Error error;
    Status s = failingCall();
    s.log().toError(error);

    REQUIRE(error.code == OTPC_CC_InvalidToken);
    REQUIRE(std::string(error.szDescription) ==
        "Token must contain only digits");
    REQUIRE(std::string(error.szSourceFunc) == "failingCall");
    REQUIRE(error.nSourceLine == static_cast<int>(s.line()));

    // Long messages are truncated:
    Status big = OTPC_ERROR(OTPC_CC_Error, std::string(1000, 'x'));
    big.toError(error);
    REQUIRE(std::string(error.szDescription).size() == OTPC_MAX_STRING_LENGTH);
}

TEST_CASE("Status printing", "[util][status]")
{
    std::stringstream ss;
    ss << failingCall();
    REQUIRE(ss.str().find("failingCall returned error 10 "
        "(Token must contain only digits)") != std::string::npos);
}
