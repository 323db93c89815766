// =====================================================================
//  src/libconica/logging.cpp — Logging categories
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include "conica/logging.h"

namespace conica {

// Debug output is off by default; warnings and above are always shown.
Q_LOGGING_CATEGORY(lcResolver, "conica.resolver", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScene, "conica.scene", QtInfoMsg)
Q_LOGGING_CATEGORY(lcExpression, "conica.expression", QtInfoMsg)

}  // namespace conica
