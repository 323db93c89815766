// =====================================================================
//  src/libconica/conica/core.h — Library version and export macros
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_CORE_H
#define CONICA_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libconica as a shared library, CONICA_SHARED and
// CONICA_BUILDING are defined.  Consumers linking against the shared
// library only see CONICA_SHARED (set as a PUBLIC compile definition).

#if defined(CONICA_SHARED)
  #if defined(CONICA_BUILDING)
    #if defined(_WIN32)
      #define CONICA_EXPORT __declspec(dllexport)
    #else
      #define CONICA_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define CONICA_EXPORT __declspec(dllimport)
    #else
      #define CONICA_EXPORT
    #endif
  #endif
#else
  #define CONICA_EXPORT
#endif

namespace conica {

/// Library version string (e.g., "0.1.0").
CONICA_EXPORT const char* version();

/// Number of relaxation passes the resolver runs unless configured
/// otherwise.  Construction chains deeper than this under-resolve.
constexpr int DEFAULT_PASS_COUNT = 3;

// =====================================================================
//  Library Capabilities
// =====================================================================

/// Check if the general-to-standard conversion can recover full
/// standard parameters for a parabola.
///
/// Always false in this release: parabola coefficients are classified
/// but their vertex/focal parameters are not recovered.  Editing UIs
/// should treat parabola coefficients as read-only.
CONICA_EXPORT bool canInvertParabola();

}  // namespace conica

#endif  // CONICA_CORE_H
