/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPC_OTP_OTP_ALGORITHM_HPP
#define OTPC_OTP_OTP_ALGORITHM_HPP

#include "../util/Status.hpp"

namespace otpc {

/**
 * Returns the canonical name ("SHA1", "SHA256", "SHA512"),
 * or "unknown" for out-of-range values.
 */
const char *
otpAlgorithmName(tOTPC_Algorithm algorithm);

/**
 * Returns the secret length, in bytes, that the algorithm requires,
 * or 0 for out-of-range values.
 */
size_t
otpAlgorithmSecretLength(tOTPC_Algorithm algorithm);

/**
 * Looks up an algorithm by name, ignoring case.
 */
Status
otpAlgorithmFromName(tOTPC_Algorithm &result, const std::string &name);

} // namespace otpc

#endif
