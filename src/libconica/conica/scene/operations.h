// =====================================================================
//  src/libconica/conica/scene/operations.h — Scene operations
// =====================================================================
//
//  Whole-collection transformations.  Every operation takes the prior
//  collection and returns a new, fully relaxed one; the input is never
//  modified.  These are the only mutations a host needs: create,
//  update (partial fields) and delete (with cascade).
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_SCENE_OPERATIONS_H
#define CONICA_SCENE_OPERATIONS_H

#include "entity.h"
#include "resolver.h"
#include "../core.h"

#include <QPointF>
#include <QString>
#include <QVector>

#include <optional>
#include <variant>

namespace conica {
namespace scene {

// =====================================================================
//  Partial Updates
// =====================================================================

/// Partial attribute change for one entity
///
/// Unset fields are left alone.  Fields that do not apply to the
/// entity's kind are ignored.  Id references use NoEntity to clear.
struct EntityPatch {
    // Any kind
    std::optional<QString> name;
    std::optional<QString> color;
    std::optional<bool> hidden;

    /// Drop every construction reference and make the entity free.
    /// Applied before the other fields, so a coefficient edit can
    /// detach and set new coefficients in one patch.
    bool detach = false;

    // Points
    std::optional<QPointF> position;
    std::optional<bool> isFree;
    std::optional<EntityId> onLineId;

    // Lines
    std::optional<geometry::LineCoefficients> lineCoefficients;
    std::optional<double> angle;

    // Conics
    std::optional<geometry::ConicType> conicType;
    std::optional<QPointF> center;
    std::optional<double> semiAxisA;
    std::optional<double> semiAxisB;
    std::optional<double> rotation;

    /// Direct edit of the general equation.  Converted back to standard
    /// params immediately; for a parabola only the type is taken over.
    std::optional<geometry::ConicCoefficients> conicCoefficients;
};

/// Apply a patch to a single entity (no resolution)
CONICA_EXPORT Entity applyPatch(const Entity& entity, const EntityPatch& patch);

/// Patch that moves a point to a new position
CONICA_EXPORT EntityPatch movePointPatch(const QPointF& position);

/// Patch that replaces a line's coefficients and frees it from its
/// construction
CONICA_EXPORT EntityPatch editLineCoefficientsPatch(const geometry::LineCoefficients& coeffs);

// =====================================================================
//  Operations
// =====================================================================

/// Insert an entity and relax.  NoEntity ids are replaced by
/// nextEntityId(); an id already in use rejects the insert.
CONICA_EXPORT QVector<Entity> createEntity(const QVector<Entity>& entities,
                                           const Entity& entity,
                                           const ResolverOptions& options = ResolverOptions(),
                                           ResolveReport* report = nullptr);

/// Insert several entities (e.g. one construction) and relax once.
/// Ids must be unique and not in use; otherwise nothing is inserted.
CONICA_EXPORT QVector<Entity> createEntities(const QVector<Entity>& entities,
                                             const QVector<Entity>& added,
                                             const ResolverOptions& options = ResolverOptions(),
                                             ResolveReport* report = nullptr);

/// Apply a patch to one entity and relax.  Unknown ids leave the
/// collection unchanged (still relaxed).
CONICA_EXPORT QVector<Entity> updateEntity(const QVector<Entity>& entities,
                                           EntityId id,
                                           const EntityPatch& patch,
                                           const ResolverOptions& options = ResolverOptions(),
                                           ResolveReport* report = nullptr);

/// Cascade-delete an entity and relax the survivors
CONICA_EXPORT QVector<Entity> deleteEntity(const QVector<Entity>& entities,
                                           EntityId id,
                                           const ResolverOptions& options = ResolverOptions(),
                                           QVector<EntityId>* removed = nullptr);

// =====================================================================
//  Actions
// =====================================================================

struct CreateAction {
    QVector<Entity> entities;    ///< One entity, or a whole construction
};

struct UpdateAction {
    EntityId id = NoEntity;
    EntityPatch patch;
};

struct DeleteAction {
    EntityId id = NoEntity;
};

/// One discrete user action
using Action = std::variant<CreateAction, UpdateAction, DeleteAction>;

/// Apply an action: the core's single entry point for hosts
CONICA_EXPORT QVector<Entity> apply(const QVector<Entity>& entities,
                                    const Action& action,
                                    const ResolverOptions& options = ResolverOptions(),
                                    ResolveReport* report = nullptr);

}  // namespace scene
}  // namespace conica

#endif  // CONICA_SCENE_OPERATIONS_H
