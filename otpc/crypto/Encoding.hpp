/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OTPC_CRYPTO_ENCODING_HPP
#define OTPC_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"

namespace otpc {

/**
 * Encodes data into a base-32 string according to rfc4648.
 */
std::string
base32Encode(DataSlice data);

/**
 * Decodes a base-32 string as defined by rfc4648.
 * The trailing '=' padding is optional, but if present it must be complete.
 */
bool
base32Decode(DataChunk &result, const std::string &in);

} // namespace otpc

#endif
