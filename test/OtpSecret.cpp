/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpc/otp/OtpSecret.hpp"
#include <catch2/catch.hpp>

TEST_CASE("Generated secrets", "[otp][secret]")
{
    for (size_t length: {20, 32, 64})
    {
        std::string text;
        REQUIRE(otpc::otpSecretGenerate(text, length));

        otpc::DataChunk secret;
        REQUIRE(otpc::otpSecretDecode(secret, text));
        REQUIRE(secret.size() == length);
        REQUIRE(otpc::otpSecretEncode(secret) == text);
    }

    // Two secrets should never collide:
    std::string a, b;
    REQUIRE(otpc::otpSecretGenerate(a));
    REQUIRE(otpc::otpSecretGenerate(b));
    REQUIRE(a != b);
}

TEST_CASE("Unsupported secret lengths", "[otp][secret]")
{
    std::string text;
    for (size_t length: {0, 10, 16, 21, 128})
    {
        auto s = otpc::otpSecretGenerate(text, length);
        REQUIRE(s.value() == OTPC_CC_InvalidSecret);
        REQUIRE(s.message() == "Secret length must be 20, 32, or 64 bytes");
    }
}

TEST_CASE("Secret text is normalized before decoding", "[otp][secret]")
{
    otpc::DataChunk secret;

    REQUIRE(otpc::otpSecretDecode(secret,
        " gezd gnbv gy3t qojq\tGEZD GNBV GY3T QOJQ\n"));
    REQUIRE(otpc::toString(secret) == "12345678901234567890");

    REQUIRE(otpc::otpSecretDecode(secret, "mzxw6ytboi======"));
    REQUIRE(otpc::toString(secret) == "foobar");
}

TEST_CASE("Bad secret text", "[otp][secret]")
{
    otpc::DataChunk secret;

    for (auto text: {"", "   ", "====", "MZXW6YTB!", "MZXW-6YTB", "MZ=XW6YTB",
        "MZXW6YT8"})
    {
        auto s = otpc::otpSecretDecode(secret, text);
        REQUIRE(s.value() == OTPC_CC_InvalidSecret);
    }
}
