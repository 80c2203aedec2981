/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../src/OTPC.h"
#include <catch2/catch.hpp>
#include <string>

static const char rfcSecret[] = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";

TEST_CASE("Exported TOTP functions", "[api]")
{
    tOTPC_Error error;
    REQUIRE(OTPC_CC_Ok == OTPC_Initialize(nullptr, &error));

    const int64_t now = 1111111109000;
    char *szToken = nullptr;
    int remaining = 0;
    REQUIRE(OTPC_CC_Ok == OTPC_TotpGenerate(rfcSecret, OTPC_Algorithm_SHA1,
        8, 30, &now, &szToken, &remaining, &error));
    CHECK(std::string(szToken) == "07081804");
    CHECK(remaining == 1);

    bool valid = false;
    int delta = 99;
    const int64_t later = now + 30000;
    REQUIRE(OTPC_CC_Ok == OTPC_TotpValidate(rfcSecret, OTPC_Algorithm_SHA1,
        8, 30, szToken, &later, 1, &valid, &delta, &error));
    CHECK(valid);
    CHECK(delta == -1);
    OTPC_FreeStr(szToken);

    REQUIRE(OTPC_CC_Ok == OTPC_TotpValidate(rfcSecret, OTPC_Algorithm_SHA1,
        8, 30, "00000000", &later, 1, &valid, nullptr, &error));
    CHECK_FALSE(valid);

    int64_t step = 0;
    REQUIRE(OTPC_CC_Ok == OTPC_TotpTimeStep(30, &now, &step, &error));
    CHECK(step == 37037036);

    OTPC_Terminate();
}

TEST_CASE("Exported HOTP functions", "[api]")
{
    tOTPC_Error error;

    char *szToken = nullptr;
    REQUIRE(OTPC_CC_Ok == OTPC_HotpGenerate(rfcSecret, OTPC_Algorithm_SHA1,
        6, 1, &szToken, &error));
    CHECK(std::string(szToken) == "287082");
    OTPC_FreeStr(szToken);

    bool valid = false;
    int64_t used = 0;
    REQUIRE(OTPC_CC_Ok == OTPC_HotpValidate(rfcSecret, OTPC_Algorithm_SHA1,
        6, "969429", 1, 4, &valid, &used, &error));
    CHECK(valid);
    CHECK(used == 3);
}

TEST_CASE("Exported secret generation", "[api]")
{
    tOTPC_Error error;

    char *szSecret = nullptr;
    REQUIRE(OTPC_CC_Ok == OTPC_GenerateSecret(20, &szSecret, &error));
    CHECK(std::string(szSecret).size() == 32);

    char *szToken = nullptr;
    REQUIRE(OTPC_CC_Ok == OTPC_TotpGenerate(szSecret, OTPC_Algorithm_SHA1,
        6, 30, nullptr, &szToken, nullptr, &error));
    CHECK(std::string(szToken).size() == 6);
    OTPC_FreeStr(szToken);
    OTPC_FreeStr(szSecret);
}

TEST_CASE("Exported error reporting", "[api]")
{
    tOTPC_Error error;
    char *szToken = nullptr;

    CHECK(OTPC_CC_InvalidDigits == OTPC_HotpGenerate(rfcSecret,
        OTPC_Algorithm_SHA1, 10, 0, &szToken, &error));
    CHECK(error.code == OTPC_CC_InvalidDigits);
    CHECK(std::string(error.szDescription) ==
        "Digits must be an integer between 6 and 8");

    CHECK(OTPC_CC_InvalidSecret == OTPC_GenerateSecret(16, &szToken, &error));

    CHECK(OTPC_CC_NULLPtr == OTPC_HotpGenerate(nullptr,
        OTPC_Algorithm_SHA1, 6, 0, &szToken, &error));

    bool valid = true;
    CHECK(OTPC_CC_InvalidToken == OTPC_TotpValidate(rfcSecret,
        OTPC_Algorithm_SHA1, 6, 30, "abc", nullptr, 1, &valid, nullptr,
        &error));

    int64_t step = 0;
    CHECK(OTPC_CC_InvalidPeriod == OTPC_TotpTimeStep(0, nullptr, &step,
        &error));
}
