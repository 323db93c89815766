// =====================================================================
//  src/libconica/conica/scene/scene.h — Scene holder
// =====================================================================
//
//  Stateful front end over the scene operations.  A host (canvas,
//  properties panel, script) keeps one Scene, feeds it discrete user
//  actions and redraws from entities() afterwards.
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_SCENE_SCENE_H
#define CONICA_SCENE_SCENE_H

#include "entity.h"
#include "operations.h"
#include "resolver.h"
#include "../core.h"

#include <QPointF>
#include <QVector>

namespace conica {
namespace scene {

// =====================================================================
//  Scene Class
// =====================================================================

/// Current entity collection plus the resolver configuration
///
/// Every mutating call replaces the collection with a freshly relaxed
/// one.  Calls that name an unknown id, or that do not apply to the
/// entity they name, return false and leave the scene as it was.
///
/// Example usage:
/// @code
///     Scene scene;
///     scene.loadDemo();
///
///     // Drag the pivot point; the rotating line and its two
///     // intersections with the ellipse follow.
///     scene.movePoint(pivotId, QPointF(1.0, -2.5));
///
///     if (!scene.lastReport().converged) {
///         // a construction chain is deeper than the pass count
///     }
/// @endcode
class CONICA_EXPORT Scene {
public:
    Scene();
    explicit Scene(const ResolverOptions& options);

    // ---- Access ----

    const QVector<Entity>& entities() const { return m_entities; }
    const Entity* find(EntityId id) const;
    int count() const { return m_entities.size(); }
    bool isEmpty() const { return m_entities.isEmpty(); }

    const ResolverOptions& options() const { return m_options; }
    void setOptions(const ResolverOptions& options);

    /// Diagnostics of the most recent resolution
    const ResolveReport& lastReport() const { return m_lastReport; }

    // ---- Actions ----

    /// Insert one entity.  A NoEntity id is allocated and an empty name
    /// gets the kind's automatic name.
    /// @return The entity's id, or NoEntity if the id was already taken
    EntityId create(const Entity& entity);

    /// Insert the output of a construction builder
    /// @return False if the list is empty or an id is taken
    bool createAll(const QVector<Entity>& entities);

    /// Apply a partial update
    bool update(EntityId id, const EntityPatch& patch);

    /// Cascade-delete an entity
    /// @return Ids removed, the entity itself included
    QVector<EntityId> remove(EntityId id);

    /// Apply any action
    void apply(const Action& action);

    /// Remove everything
    void clear();

    /// Replace the scene with the demo construction
    void loadDemo();

    // ---- Direct Manipulation ----

    /// Move a free point, or a point bound to a line
    bool movePoint(EntityId id, const QPointF& position);

    /// Translate a free line by (dx, dy)
    bool translateLine(EntityId id, double dx, double dy);

    /// Rotate a pivot line so that it points at `target`
    bool aimPivotLine(EntityId id, const QPointF& target);

    // ---- Queries ----

    /// Visible points and lines within `radius` of `position`
    QVector<EntityId> entitiesNear(const QPointF& position, double radius) const;

    /// Remove every visible point and line within `radius` of
    /// `position` (with cascade)
    /// @return All ids removed
    QVector<EntityId> eraseNear(const QPointF& position, double radius);

private:
    void replace(const QVector<Entity>& next);

    QVector<Entity> m_entities;
    ResolverOptions m_options;
    ResolveReport m_lastReport;
};

}  // namespace scene
}  // namespace conica

#endif  // CONICA_SCENE_SCENE_H
