/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../otpc/otp/Totp.hpp"
#include "../otpc/crypto/Encoding.hpp"
#include <catch2/catch.hpp>
#include <limits>
#include <cstdlib>

static const char sha1Seed[] = "12345678901234567890";
static const char sha256Seed[] = "12345678901234567890123456789012";
static const char sha512Seed[] =
    "1234567890123456789012345678901234567890123456789012345678901234";

static otpc::TotpConfig
rfcConfig(tOTPC_Algorithm algorithm, const char *seed)
{
    otpc::TotpConfig config;
    config.secret = otpc::base32Encode(std::string(seed));
    config.algorithm = algorithm;
    config.digits = 8;
    config.period = 30;
    return config;
}

static std::shared_ptr<otpc::Totp>
makeTotp(const otpc::TotpConfig &config)
{
    std::shared_ptr<otpc::Totp> totp;
    REQUIRE(otpc::Totp::create(totp, config));
    REQUIRE(totp);
    return totp;
}

TEST_CASE("RFC 6238 test vectors", "[otp][totp]")
{
    struct TestCase
    {
        int64_t time;
        const char *sha1;
        const char *sha256;
        const char *sha512;
    };
    TestCase cases[] =
    {
        {59,          "94287082", "46119246", "90693936"},
        {1111111109,  "07081804", "68084774", "25091201"},
        {1111111111,  "14050471", "67062674", "99943326"},
        {1234567890,  "89005924", "91819424", "93441116"},
        {2000000000,  "69279037", "90698825", "38618901"},
        {20000000000, "65353130", "77737706", "47863826"}
    };

    auto sha1 = makeTotp(rfcConfig(OTPC_Algorithm_SHA1, sha1Seed));
    auto sha256 = makeTotp(rfcConfig(OTPC_Algorithm_SHA256, sha256Seed));
    auto sha512 = makeTotp(rfcConfig(OTPC_Algorithm_SHA512, sha512Seed));

    for (auto &test: cases)
    {
        otpc::OtpResult result;
        REQUIRE(sha1->generate(result, test.time * 1000));
        CHECK(result.token == test.sha1);
        REQUIRE(sha256->generate(result, test.time * 1000));
        CHECK(result.token == test.sha256);
        REQUIRE(sha512->generate(result, test.time * 1000));
        CHECK(result.token == test.sha512);

        otpc::ValidationResult validation;
        REQUIRE(sha512->validate(validation, test.sha512, test.time * 1000));
        CHECK(validation.isValid);
        CHECK(validation.delta == 0);
    }
}

TEST_CASE("TOTP configuration checks", "[otp][totp]")
{
    std::shared_ptr<otpc::Totp> totp;
    const auto good = rfcConfig(OTPC_Algorithm_SHA256, sha256Seed);
    REQUIRE(otpc::Totp::create(totp, good));

    auto config = good;
    config.secret = "short";
    CHECK(otpc::Totp::create(totp, config).value() == OTPC_CC_InvalidSecret);

    config = good;
    config.secret = otpc::base32Encode(std::string(sha1Seed));
    CHECK(otpc::Totp::create(totp, config).value() == OTPC_CC_InvalidSecret);

    config = good;
    config.algorithm = static_cast<tOTPC_Algorithm>(OTPC_Algorithm_Count);
    CHECK(otpc::Totp::create(totp, config).value() == OTPC_CC_InvalidAlgorithm);

    config = good;
    config.digits = 5;
    CHECK(otpc::Totp::create(totp, config).value() == OTPC_CC_InvalidDigits);

    config = good;
    config.period = 0;
    CHECK(otpc::Totp::create(totp, config).value() == OTPC_CC_InvalidPeriod);

    // The secret problem is reported first:
    config.secret = "";
    CHECK(otpc::Totp::create(totp, config).value() == OTPC_CC_InvalidSecret);
}

TEST_CASE("TOTP generation", "[otp][totp]")
{
    auto config = rfcConfig(OTPC_Algorithm_SHA1, sha1Seed);
    const int64_t timestamp = 1234567890000;

    SECTION("token length follows the digit count")
    {
        for (int digits = 6; digits <= 8; ++digits)
        {
            config.digits = digits;
            otpc::OtpResult result;
            REQUIRE(makeTotp(config)->generate(result, timestamp));
            CHECK(result.token.size() == static_cast<size_t>(digits));
            CHECK(result.token.find_first_not_of("0123456789") ==
                std::string::npos);
        }
    }

    SECTION("same time, same token")
    {
        auto totp = makeTotp(config);
        otpc::OtpResult a, b;
        REQUIRE(totp->generate(a, timestamp));
        REQUIRE(totp->generate(b, timestamp + 29999));
        CHECK(a.token == b.token);
    }

    SECTION("next period, new token")
    {
        auto totp = makeTotp(config);
        otpc::OtpResult a, b;
        REQUIRE(totp->generate(a, timestamp));
        REQUIRE(totp->generate(b, timestamp + 30000));
        CHECK(a.token != b.token);
    }

    SECTION("remaining time")
    {
        auto totp = makeTotp(config);
        otpc::OtpResult result;

        REQUIRE(totp->generate(result, timestamp));
        CHECK(result.remainingTime == 30);
        REQUIRE(totp->generate(result, 59000));
        CHECK(result.remainingTime == 1);
        REQUIRE(totp->generate(result, 59500));
        CHECK(result.remainingTime == 1);
        REQUIRE(totp->generate(result, 45001));
        CHECK(result.remainingTime == 15);
    }

    SECTION("current time")
    {
        auto totp = makeTotp(config);
        otpc::OtpResult result;
        REQUIRE(totp->generate(result));
        CHECK(result.token.size() == 8);
        CHECK(0 < result.remainingTime);
        CHECK(result.remainingTime <= 30);
    }

    SECTION("before the epoch")
    {
        otpc::OtpResult result;
        auto s = makeTotp(config)->generate(result, -1);
        CHECK(s.value() == OTPC_CC_InvalidCounter);
    }
}

TEST_CASE("TOTP validation window", "[otp][totp]")
{
    auto totp = makeTotp(rfcConfig(OTPC_Algorithm_SHA256, sha256Seed));
    const int64_t timestamp = 1234567890000;

    otpc::OtpResult generated;
    REQUIRE(totp->generate(generated, timestamp));

    // Checking later finds the token in the past, and vice versa:
    for (int shift = -3; shift <= 3; ++shift)
    {
        for (unsigned window = 0; window <= 2; ++window)
        {
            otpc::ValidationResult result;
            REQUIRE(totp->validate(result, generated.token,
                timestamp + 30000 * shift, window));
            if (static_cast<unsigned>(std::abs(shift)) <= window)
            {
                CHECK(result.isValid);
                CHECK(result.delta == -shift);
                CHECK(result.usedCounter == totp->currentTimeStep(timestamp));
            }
            else
            {
                CHECK_FALSE(result.isValid);
            }
        }
    }
}

TEST_CASE("TOTP validation outcomes", "[otp][totp]")
{
    auto totp = makeTotp(rfcConfig(OTPC_Algorithm_SHA1, sha1Seed));

    SECTION("wrong tokens are not errors")
    {
        otpc::ValidationResult result;
        REQUIRE(totp->validate(result, "00000000", 1234567890000));
        CHECK_FALSE(result.isValid);
    }

    SECTION("malformed tokens are errors")
    {
        otpc::ValidationResult result;
        for (auto token: {"", "invalid", "1234567", "123456789", "1234567a"})
        {
            auto s = totp->validate(result, token, 1234567890000);
            CHECK(s.value() == OTPC_CC_InvalidToken);
        }
        CHECK(totp->validate(result, "").value() == OTPC_CC_InvalidToken);
    }

    SECTION("windows reaching before the epoch")
    {
        otpc::ValidationResult result;
        auto s = totp->validate(result, "94287082", 10000, 1);
        CHECK(s.value() == OTPC_CC_InvalidCounter);

        REQUIRE(totp->validate(result, "94287082", 60000, 1));
        CHECK(result.isValid);
        CHECK(result.delta == -1);
    }

    SECTION("windows too large for the delta")
    {
        otpc::ValidationResult result;
        auto s = totp->validate(result, "94287082", 59000,
            std::numeric_limits<unsigned>::max());
        CHECK(s.value() == OTPC_CC_Error);
        CHECK_FALSE(result.isValid);
    }

    SECTION("current time")
    {
        otpc::OtpResult generated;
        REQUIRE(totp->generate(generated));

        otpc::ValidationResult result;
        REQUIRE(totp->validate(result, generated.token));
        CHECK(result.isValid);
    }
}

TEST_CASE("TOTP time steps", "[otp][totp]")
{
    auto totp = makeTotp(rfcConfig(OTPC_Algorithm_SHA1, sha1Seed));

    CHECK(totp->currentTimeStep(1234567890000) == 1234567890 / 30);
    CHECK(totp->currentTimeStep(0) == 0);
    CHECK(totp->currentTimeStep(29999) == 0);
    CHECK(totp->currentTimeStep(30000) == 1);
    CHECK(totp->currentTimeStep(-1) == -1);

    int64_t before = otpc::otpNowMillis() / 30000;
    int64_t step = totp->currentTimeStep();
    int64_t after = otpc::otpNowMillis() / 30000;
    CHECK(before <= step);
    CHECK(step <= after);

    CHECK(otpc::Totp::timeStep(119999, 60) == 1);
    CHECK(otpc::Totp::timeStep(-60000, 60) == -1);
    CHECK(otpc::Totp::timeStep(-60001, 60) == -2);
}
