// =====================================================================
//  src/libconica/conica/scene/expression.h — Numeric expression evaluator
// =====================================================================
//
//  Evaluates the text typed into a numeric field of the properties
//  panel, e.g. "sqrt(2)/2" or "pi/3".
//
//  Supported syntax:
//    - Numbers: 3, 2.5, .5
//    - Operators: + - * / ^ (power is right associative), unary + and -
//    - Parentheses
//    - Constants: pi, e
//    - Functions: sqrt, sin, cos, tan (radians)
//
//  Names are case-insensitive and whitespace is ignored.
//
//  Part of libconica.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef CONICA_SCENE_EXPRESSION_H
#define CONICA_SCENE_EXPRESSION_H

#include "../core.h"

#include <QString>

#include <optional>

namespace conica {
namespace scene {

/// Evaluate an expression
/// @param expression Input text
/// @param errorMsg Optional description of why no value was produced
/// @return The value if the text parses and the result is finite
CONICA_EXPORT std::optional<double> evaluateExpression(const QString& expression,
                                                       QString* errorMsg = nullptr);

}  // namespace scene
}  // namespace conica

#endif  // CONICA_SCENE_EXPRESSION_H
