#pragma once

/**
 * @file Polygon.h
 * @brief Convex polygon utilities for exact rectangle/pixel overlap
 *
 * Provides:
 * - Rotated rectangle corner generation
 * - Sutherland-Hodgman clipping against an axis-aligned box
 * - Shoelace area
 *
 * Used by:
 * - Internal/Overlap: RectangularOverlapExact
 */

#include <ApPhot/Core/Types.h>

#include <array>
#include <vector>

namespace Ap::Phot::Internal {

using Polygon = std::vector<Point2d>;

/**
 * @brief Corners of a w x h rectangle centered on the origin, rotated by theta
 *
 * @param w      Full width (along local u)
 * @param h      Full height (along local v)
 * @param theta  Rotation in degrees, counter-clockwise from +x
 * @return Corners in counter-clockwise order starting at (-w/2, -h/2)
 */
std::array<Point2d, 4> RotatedRectCorners(double w, double h, double theta);

/**
 * @brief Clip a polygon against the box [xMin, xMax] x [yMin, yMax]
 *
 * Sutherland-Hodgman against the four box half-planes. The subject polygon
 * must be convex for the result to be a single polygon.
 *
 * @return Clipped polygon (empty when there is no overlap)
 */
Polygon ClipPolygonToBox(const Polygon& poly, double xMin, double yMin,
                         double xMax, double yMax);

/**
 * @brief Polygon area by the shoelace formula (orientation independent)
 */
double PolygonArea(const Polygon& poly);

} // namespace Ap::Phot::Internal
