/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpSecret.hpp"
#include "../crypto/Encoding.hpp"
#include "../crypto/Random.hpp"
#include "../util/Util.hpp"
#include <ctype.h>

namespace otpc {

Status
otpSecretGenerate(std::string &result, size_t length)
{
    if (OTPC_SECRET_LENGTH_SHA1 != length &&
        OTPC_SECRET_LENGTH_SHA256 != length &&
        OTPC_SECRET_LENGTH_SHA512 != length)
        return OTPC_ERROR(OTPC_CC_InvalidSecret,
            "Secret length must be 20, 32, or 64 bytes");

    DataChunk secret;
    OTPC_CHECK(randomData(secret, length));
    result = base32Encode(secret);
    dataWipe(secret);

    return Status();
}

Status
otpSecretDecode(DataChunk &result, const std::string &text)
{
    if (text.empty())
        return OTPC_ERROR(OTPC_CC_InvalidSecret,
            "Secret must be a non-empty string");

    // Strip whitespace and fold to upper case:
    std::string clean;
    clean.reserve(text.size());
    for (char c: text)
        if (!isspace(static_cast<unsigned char>(c)))
            clean += static_cast<char>(toupper(static_cast<unsigned char>(c)));

    // Only A-Z and 2-7, followed by optional padding:
    auto i = clean.begin();
    while (i != clean.end() &&
        (('A' <= *i && *i <= 'Z') || ('2' <= *i && *i <= '7')))
        ++i;
    bool symbols = i != clean.begin();
    while (i != clean.end() && '=' == *i)
        ++i;

    DataChunk out;
    if (!symbols || i != clean.end() || !base32Decode(out, clean))
    {
        OTPC_UtilGuaranteedMemset(&clean[0], 0, clean.size());
        return OTPC_ERROR(OTPC_CC_InvalidSecret,
            "Secret must be a valid base32-encoded string (A-Z, 2-7)");
    }
    OTPC_UtilGuaranteedMemset(&clean[0], 0, clean.size());

    result = std::move(out);
    return Status();
}

std::string
otpSecretEncode(DataSlice secret)
{
    return base32Encode(secret);
}

} // namespace otpc
