#pragma once

/**
 * @file Overlap.h
 * @brief Exact and sampled overlap between a pixel and an aperture boundary
 *
 * All routines work in shape-local coordinates: the shape is centered on the
 * origin and the pixel is the axis-aligned box [xMin, xMax] x [yMin, yMax].
 * The returned value is an area, which equals the overlap fraction for unit
 * pixels.
 *
 * Provides:
 * - Circle / box exact area (quadrant reduction + closed form)
 * - Ellipse / box exact area (affine map to the unit circle, triangle split)
 * - Rotated rectangle / box exact area (polygon clipping)
 * - Subpixel sampling with an arbitrary inside predicate
 *
 * Part of the exact circle and ellipse derivations follow photutils and SEP
 * (BSD 3-clause).
 */

#include <ApPhot/Core/Types.h>

#include <cstdint>

namespace Ap::Phot::Internal {

// =============================================================================
// Geometric Primitives
// =============================================================================

/**
 * @brief Unsigned area of the triangle (x0, y0), (x1, y1), (x2, y2)
 */
double TriangleArea(double x0, double y0, double x1, double y1, double x2, double y2);

/**
 * @brief Area of the circular segment cut off by the chord between two points
 *        on a circle of radius r
 *
 * theta = 2 asin(chord / 2r), area = r^2 (theta - sin theta) / 2.
 * The arcsine argument is clamped so chords slightly longer than 2r
 * (round-off) give a half disk.
 */
double CircularSegmentArea(double x0, double y0, double x1, double y1, double r);

/**
 * @brief Crossing-number test of (x, y) against a triangle
 */
bool PointInTriangle(double x, double y,
                     double x1, double y1, double x2, double y2, double x3, double y3);

/**
 * @brief Intersection points of a line or segment with the unit circle
 *
 * Points are ordered along the direction p1 -> p2. Tangency counts as no
 * intersection.
 */
struct CircleIntersection {
    int32_t count = 0;  ///< Number of valid points (0, 1 or 2)
    Point2d first;      ///< Valid when count >= 1
    Point2d second;     ///< Valid when count == 2
};

/// Intersections of the infinite line through p1 and p2 with the unit circle
CircleIntersection LineCircleIntersection(const Point2d& p1, const Point2d& p2);

/// Intersections of the closed segment [p1, p2] with the unit circle
/// (endpoints within ON_CIRCLE_TOLERANCE in the line parameter count)
CircleIntersection SegmentCircleIntersection(const Point2d& p1, const Point2d& p2);

/**
 * @brief Intersection of the line through p1 and p2 with the unit circle that
 *        lies closest to p2
 *
 * Intended for p1 inside (or on) the circle and p2 outside, where the result
 * is the crossing on the segment. Returns p1 if the line misses or only
 * touches the circle.
 */
Point2d NearestCircleIntersection(const Point2d& p1, const Point2d& p2);

/**
 * @brief Area of the overlap between a triangle and the unit circle
 *
 * Vertices are sorted by distance from the origin and classified as inside
 * or on the circle; the overlap is then assembled from triangles and circular
 * segments, splitting the triangle at a chord midpoint when no vertex is
 * inside.
 */
double TriangleUnitCircleOverlap(double x1, double y1, double x2, double y2,
                                 double x3, double y3);

// =============================================================================
// Exact Pixel Overlap
// =============================================================================

/**
 * @brief Exact area of the box intersected with the circle of radius r
 *        centered on the origin
 *
 * @return 0 for r <= 0, otherwise an area in [0, (xMax - xMin)(yMax - yMin)]
 */
double CircularOverlapExact(double xMin, double yMin, double xMax, double yMax, double r);

/**
 * @brief Exact area of the box intersected with the ellipse with semi-axes
 *        a, b rotated by theta degrees, centered on the origin
 */
double EllipticalOverlapExact(double xMin, double yMin, double xMax, double yMax,
                              double a, double b, double theta);

/**
 * @brief Exact area of the box intersected with the w x h rectangle rotated by
 *        theta degrees, centered on the origin
 */
double RectangularOverlapExact(double xMin, double yMin, double xMax, double yMax,
                               double w, double h, double theta);

// =============================================================================
// Subpixel Sampling
// =============================================================================

/**
 * @brief Fraction of an N x N grid of sample centers inside a shape
 *
 * @param inside  Predicate on shape-local (x, y); must use strict comparisons
 *                so points on the boundary are outside
 * @param subpixels  Samples per axis (>= 1). With 1 the pixel center decides.
 * @return Fraction in [0, 1]
 */
template<typename InsideFn>
double SubpixelOverlap(double xMin, double yMin, double xMax, double yMax,
                       int32_t subpixels, InsideFn&& inside) {
    double dx = (xMax - xMin) / subpixels;
    double dy = (yMax - yMin) / subpixels;

    int64_t count = 0;
    for (int32_t i = 0; i < subpixels; ++i) {
        double x = xMin + (i + 0.5) * dx;
        for (int32_t j = 0; j < subpixels; ++j) {
            double y = yMin + (j + 0.5) * dy;
            if (inside(x, y)) ++count;
        }
    }
    return static_cast<double>(count) / (static_cast<double>(subpixels) * subpixels);
}

} // namespace Ap::Phot::Internal
