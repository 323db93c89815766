// =====================================================================
//  src/libconica/conica/logging.h — Logging categories
// =====================================================================
//
//  Qt logging categories used by libconica.  Hosts can enable or
//  silence them with QLoggingCategory::setFilterRules(), e.g.
//  "conica.resolver.debug=true".
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_LOGGING_H
#define CONICA_LOGGING_H

#include "core.h"

#include <QLoggingCategory>

namespace conica {

CONICA_EXPORT const QLoggingCategory& lcResolver();
CONICA_EXPORT const QLoggingCategory& lcScene();
CONICA_EXPORT const QLoggingCategory& lcExpression();

}  // namespace conica

#endif  // CONICA_LOGGING_H
