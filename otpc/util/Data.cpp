/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Data.hpp"
#include "Util.hpp"

namespace otpc {

std::string
toString(DataSlice slice)
{
    return std::string(reinterpret_cast<const char *>(slice.data()),
                       slice.size());
}

void
dataWipe(DataChunk &data)
{
    OTPC_UtilGuaranteedMemset(data.data(), 0, data.size());
    data.clear();
    data.shrink_to_fit();
}

} // namespace otpc
