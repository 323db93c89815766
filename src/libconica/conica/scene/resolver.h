// =====================================================================
//  src/libconica/conica/scene/resolver.h — Dependency resolver
// =====================================================================
//
//  Recomputes every derived attribute of a scene from its dependencies
//  by bounded relaxation: a fixed number of passes, each reading only
//  the previous pass's values and producing a new collection.
//
//  The resolver never fails.  A dependency that cannot be resolved
//  leaves the entity unchanged for that pass; a degenerate numeric
//  configuration hides the entity or falls back to an identity result.
//
//  Example usage:
//  @code
//      Resolver resolver;
//      ResolveReport report;
//      QVector<Entity> next = resolver.resolve(entities, &report);
//      if (!report.converged) {
//          // construction chain deeper than the pass count
//      }
//  @endcode
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_SCENE_RESOLVER_H
#define CONICA_SCENE_RESOLVER_H

#include "entity.h"
#include "../core.h"

#include <QHash>
#include <QVector>

namespace conica {
namespace scene {

// =====================================================================
//  Options and Report
// =====================================================================

/// Resolver configuration
struct ResolverOptions {
    int passCount = DEFAULT_PASS_COUNT;  ///< Relaxation passes per resolution
    bool detectNonConvergence = true;    ///< Run a verification pass after the last one
    double convergenceTolerance = 1e-9;  ///< Relative tolerance for that comparison
};

/// Diagnostics of one resolution
struct ResolveReport {
    int passes = 0;                      ///< Passes executed
    bool converged = true;               ///< False if another pass would still change values
    QVector<EntityId> unsettled;         ///< Entities another pass would change
};

/// Read-only id lookup over one pass's input
using EntityLookup = QHash<EntityId, const Entity*>;

// =====================================================================
//  Resolver
// =====================================================================

class CONICA_EXPORT Resolver {
public:
    Resolver();
    explicit Resolver(const ResolverOptions& options);

    const ResolverOptions& options() const { return m_options; }
    void setOptions(const ResolverOptions& options);

    /// Run the configured number of passes over the collection
    /// @param entities Current collection (not modified)
    /// @param report Optional diagnostics
    /// @return New collection with derived attributes recomputed
    QVector<Entity> resolve(const QVector<Entity>& entities,
                            ResolveReport* report = nullptr) const;

private:
    ResolverOptions m_options;
};

// =====================================================================
//  Pass Functions
// =====================================================================

/// One relaxation pass: every entity recomputed from `entities`
CONICA_EXPORT QVector<Entity> relaxationPass(const QVector<Entity>& entities);

/// Recompute a single entity against a lookup of the pass input.
/// Rules are tried in priority order; the first applicable one wins.
CONICA_EXPORT Entity resolveEntity(const Entity& entity, const EntityLookup& lookup);

/// Convenience: resolve with the given options
CONICA_EXPORT QVector<Entity> resolve(const QVector<Entity>& entities,
                                      const ResolverOptions& options = ResolverOptions(),
                                      ResolveReport* report = nullptr);

}  // namespace scene
}  // namespace conica

#endif  // CONICA_SCENE_RESOLVER_H
