// =====================================================================
//  src/libconica/core.cpp -- Library version and capabilities
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "conica/core.h"

#ifndef CONICA_VERSION_STRING
#define CONICA_VERSION_STRING "0.1.0"
#endif

namespace conica {

const char* version()
{
    return CONICA_VERSION_STRING;
}

bool canInvertParabola()
{
    return false;
}

}  // namespace conica
