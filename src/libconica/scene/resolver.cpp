// =====================================================================
//  src/libconica/scene/resolver.cpp — Dependency resolver
// =====================================================================
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <conica/scene/resolver.h>
#include <conica/geometry/conics.h>
#include <conica/geometry/intersections.h>
#include <conica/geometry/utils.h>
#include <conica/logging.h>

namespace conica {
namespace scene {

using namespace geometry;

namespace {

const Entity* lookupEntity(const EntityLookup& lookup, EntityId id)
{
    if (id == NoEntity) return nullptr;
    return lookup.value(id, nullptr);
}

const PointData* lookupPoint(const EntityLookup& lookup, EntityId id)
{
    const Entity* e = lookupEntity(lookup, id);
    return e ? e->point() : nullptr;
}

const LineData* lookupLine(const EntityLookup& lookup, EntityId id)
{
    const Entity* e = lookupEntity(lookup, id);
    return e ? e->line() : nullptr;
}

// Coefficients are read through the standard params so that a conic
// edited in this pass is seen with its current shape.
ConicCoefficients currentCoefficients(const ConicData& conic)
{
    return standardToGeneral(conic.params);
}

/// Operand pair typed as (A, B) in either order
template <typename A, typename B>
bool matchOperands(const Entity& entity, const EntityLookup& lookup,
                   const A*& first, const B*& second)
{
    first = nullptr;
    second = nullptr;
    if (entity.dependencies.size() != 2) return false;

    const Entity* d1 = lookupEntity(lookup, entity.dependencies[0]);
    const Entity* d2 = lookupEntity(lookup, entity.dependencies[1]);
    if (!d1 || !d2) return false;

    const A* a1 = std::get_if<A>(&d1->data);
    const B* b2 = std::get_if<B>(&d2->data);
    if (a1 && b2) {
        first = a1;
        second = b2;
        return true;
    }

    const B* b1 = std::get_if<B>(&d1->data);
    const A* a2 = std::get_if<A>(&d2->data);
    if (b1 && a2) {
        first = a2;
        second = b1;
        return true;
    }

    return false;
}

// =====================================================================
//  Per-kind Rules
// =====================================================================

struct RuleVisitor {
    const Entity& entity;
    const EntityLookup& lookup;

    Entity operator()(const ConicData& conic) const
    {
        // Always derived
        Entity out = entity;
        out.conic()->coeffs = standardToGeneral(conic.params);
        return out;
    }

    Entity operator()(const LineData& line) const
    {
        // Pivot + angle
        if (line.hasPivot()) {
            if (const PointData* pivot = lookupPoint(lookup, line.pivotPointId)) {
                Entity out = entity;
                out.line()->coeffs = lineFromPointAndAngle(pivot->position, *line.angle);
                return out;
            }
        }

        // Two points
        if (line.hasTwoPoints()) {
            const PointData* p1 = lookupPoint(lookup, line.p1Id);
            const PointData* p2 = lookupPoint(lookup, line.p2Id);
            if (p1 && p2) {
                Entity out = entity;
                out.line()->coeffs = lineFromTwoPoints(p1->position, p2->position);
                return out;
            }
        }

        // Polar of (point, conic)
        const PointData* pole = nullptr;
        const ConicData* conic = nullptr;
        if (matchOperands(entity, lookup, pole, conic)) {
            Entity out = entity;
            out.line()->coeffs = polarLine(pole->position, currentCoefficients(*conic));
            return out;
        }

        return entity;
    }

    Entity operator()(const PointData& point) const
    {
        const bool twoOperands = entity.dependencies.size() == 2;

        // Line x conic, indexed solution
        if (!point.isFree && twoOperands && point.solutionIndex.has_value()) {
            const LineData* line = nullptr;
            const ConicData* conic = nullptr;
            if (matchOperands(entity, lookup, line, conic)) {
                const LineConicIntersection hits =
                    lineConicIntersection(line->coeffs, currentCoefficients(*conic));
                const std::optional<QPointF> hit = hits.solution(*point.solutionIndex);

                Entity out = entity;
                if (hit) {
                    out.point()->position = *hit;
                    out.hidden = false;
                } else {
                    // Keep last coordinates while there is no real solution
                    out.hidden = true;
                }
                return out;
            }
        }

        // Projection onto a line, regardless of freeness
        if (point.onLineId != NoEntity) {
            if (const LineData* line = lookupLine(lookup, point.onLineId)) {
                Entity out = entity;
                out.point()->position = closestPointOnLine(point.position, line->coeffs);
                return out;
            }
        }

        // Line x line
        if (!point.isFree && twoOperands && !point.solutionIndex.has_value()) {
            const LineData* l1 = lookupLine(lookup, entity.dependencies[0]);
            const LineData* l2 = lookupLine(lookup, entity.dependencies[1]);
            if (l1 && l2) {
                const LineLineIntersection hit = lineLineIntersection(l1->coeffs, l2->coeffs);

                Entity out = entity;
                if (hit.intersects) {
                    out.point()->position = hit.point;
                    out.hidden = false;
                } else {
                    out.hidden = true;
                }
                return out;
            }
        }

        return entity;
    }
};

}  // namespace

// =====================================================================
//  Pass Functions
// =====================================================================

Entity resolveEntity(const Entity& entity, const EntityLookup& lookup)
{
    return std::visit(RuleVisitor{ entity, lookup }, entity.data);
}

QVector<Entity> relaxationPass(const QVector<Entity>& entities)
{
    EntityLookup lookup;
    lookup.reserve(entities.size());
    for (const Entity& e : entities) {
        lookup.insert(e.id, &e);
    }

    QVector<Entity> next;
    next.reserve(entities.size());
    for (const Entity& e : entities) {
        next.append(resolveEntity(e, lookup));
    }
    return next;
}

QVector<Entity> resolve(const QVector<Entity>& entities,
                        const ResolverOptions& options,
                        ResolveReport* report)
{
    return Resolver(options).resolve(entities, report);
}

// =====================================================================
//  Resolver
// =====================================================================

Resolver::Resolver() = default;

Resolver::Resolver(const ResolverOptions& options)
    : m_options(options)
{
}

void Resolver::setOptions(const ResolverOptions& options)
{
    m_options = options;
}

QVector<Entity> Resolver::resolve(const QVector<Entity>& entities,
                                  ResolveReport* report) const
{
    const int passCount = qMax(1, m_options.passCount);

    QVector<Entity> current = entities;
    for (int pass = 0; pass < passCount; ++pass) {
        current = relaxationPass(current);
    }

    ResolveReport local;
    local.passes = passCount;

    if (m_options.detectNonConvergence) {
        // One more pass, used only to see what would still move
        const QVector<Entity> check = relaxationPass(current);
        for (int i = 0; i < current.size(); ++i) {
            if (!entitiesEquivalent(current[i], check[i],
                                    m_options.convergenceTolerance)) {
                local.unsettled.append(current[i].id);
            }
        }
        local.converged = local.unsettled.isEmpty();

        if (!local.converged) {
            qCInfo(lcResolver) << "resolution did not settle after" << passCount
                               << "passes;" << local.unsettled.size()
                               << "entities still changing:" << local.unsettled;
        }
    }

    qCDebug(lcResolver) << "resolved" << current.size() << "entities in"
                        << passCount << "passes";

    if (report) *report = local;
    return current;
}

}  // namespace scene
}  // namespace conica
