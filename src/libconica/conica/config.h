// =====================================================================
//  src/libconica/conica/config.h — Resolver configuration I/O
// =====================================================================
//
//  ResolverOptions stored as a small JSON object:
//
//      {
//          "pass_count": 3,
//          "detect_non_convergence": true,
//          "convergence_tolerance": 1e-9
//      }
//
//  Missing keys keep their defaults.  A pass count outside [1, 64] is
//  clamped.
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_CONFIG_H
#define CONICA_CONFIG_H

#include "core.h"
#include "scene/resolver.h"

#include <QJsonObject>
#include <QString>

namespace conica {
namespace config {

constexpr int MIN_PASS_COUNT = 1;
constexpr int MAX_PASS_COUNT = 64;

/// Read options from a JSON object
/// @param json Source object
/// @param options Receives the parsed options (untouched on failure)
/// @param errorMsg Optional error description
/// @return false if a key holds a value of the wrong type or range
CONICA_EXPORT bool optionsFromJson(const QJsonObject& json,
                                   scene::ResolverOptions& options,
                                   QString* errorMsg = nullptr);

/// Write options to a JSON object
CONICA_EXPORT QJsonObject optionsToJson(const scene::ResolverOptions& options);

/// Read options from a JSON file
CONICA_EXPORT bool loadOptions(const QString& path,
                               scene::ResolverOptions& options,
                               QString* errorMsg = nullptr);

/// Write options to a JSON file (indented)
CONICA_EXPORT bool saveOptions(const QString& path,
                               const scene::ResolverOptions& options,
                               QString* errorMsg = nullptr);

}  // namespace config
}  // namespace conica

#endif  // CONICA_CONFIG_H
