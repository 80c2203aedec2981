/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpToken.hpp"
#include "../crypto/Hmac.hpp"
#include <sstream>

namespace otpc {

Status
otpDerive(std::string &result, DataSlice secret, tOTPC_Algorithm algorithm,
    uint64_t counter, unsigned digits)
{
    // Larger moduli do not fit the 31-bit truncated value:
    if (9 < digits)
        return OTPC_ERROR(OTPC_CC_InvalidDigits,
            "Cannot derive more than 9 digits");

    // Do HMAC(secret, counter):
    DataChunk hmac;
    DataArray<8> cb =
    {{
        static_cast<uint8_t>(counter >> 56),
        static_cast<uint8_t>(counter >> 48),
        static_cast<uint8_t>(counter >> 40),
        static_cast<uint8_t>(counter >> 32),
        static_cast<uint8_t>(counter >> 24),
        static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8),
        static_cast<uint8_t>(counter)
    }};
    OTPC_CHECK(hmacDigest(hmac, algorithm, secret, cb));

    // Calculate the truncated output:
    uint32_t p;
    OTPC_CHECK(otpTruncate(p, hmac));

    uint32_t modulus = 1;
    for (unsigned i = 0; i < digits; ++i)
        modulus *= 10;
    p %= modulus;

    // Format as a fixed-width decimal number:
    std::stringstream ss;
    ss.width(digits);
    ss.fill('0');
    ss << p;
    result = ss.str();
    return Status();
}

Status
otpTruncate(uint32_t &result, DataSlice digest)
{
    if (digest.empty())
        return OTPC_ERROR(OTPC_CC_DerivationError, "Empty HMAC digest");

    unsigned offset = digest.data()[digest.size() - 1] & 0xf;
    if (digest.size() < offset + 4)
        return OTPC_ERROR(OTPC_CC_DerivationError,
            "Invalid hash offset for truncation");

    const uint8_t *h = digest.data() + offset;
    uint32_t p = (static_cast<uint32_t>(h[0]) << 24) | (h[1] << 16) |
        (h[2] << 8) | h[3];
    result = p & 0x7fffffff;
    return Status();
}

bool
otpTokenEquals(const std::string &a, const std::string &b)
{
    if (a.size() != b.size())
        return false;

    // No early exit, so timing does not reveal the first mismatch:
    unsigned diff = 0;
    for (size_t i = 0; i < a.size(); ++i)
        diff |= static_cast<unsigned char>(a[i]) ^
            static_cast<unsigned char>(b[i]);

    return 0 == diff;
}

} // namespace otpc
