/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPC_OTP_OTP_SECRET_HPP
#define OTPC_OTP_OTP_SECRET_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace otpc {

/**
 * Creates a random secret and returns its base32 text form.
 * @param length Secret size in bytes: 20, 32, or 64.
 */
Status
otpSecretGenerate(std::string &result, size_t length=OTPC_SECRET_LENGTH_SHA256);

/**
 * Decodes the base32 text form of a secret.
 * Whitespace anywhere in the text is ignored, and so is letter case.
 */
Status
otpSecretDecode(DataChunk &result, const std::string &text);

/**
 * Encodes a secret as base32 text.
 */
std::string
otpSecretEncode(DataSlice secret);

} // namespace otpc

#endif
