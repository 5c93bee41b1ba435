#pragma once

/**
 * @file Types.h
 * @brief Basic geometric types for ApPhot
 *
 * Pixel convention: integer pixel (x, y) is the unit square centered on
 * (x, y), i.e. [x - 0.5, x + 0.5] x [y - 0.5, y + 0.5].
 */

#include <algorithm>
#include <cstdint>
#include <limits>

namespace Ap::Phot {

// =============================================================================
// Point2d
// =============================================================================

/**
 * @brief 2D point with double coordinates
 */
struct Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    Point2d operator+(const Point2d& p) const { return {x + p.x, y + p.y}; }
    Point2d operator-(const Point2d& p) const { return {x - p.x, y - p.y}; }
    Point2d operator*(double s) const { return {x * s, y * s}; }

    double Dot(const Point2d& p) const { return x * p.x + y * p.y; }
    double Cross(const Point2d& p) const { return x * p.y - y * p.x; }
    double NormSquared() const { return x * x + y * y; }

    bool operator==(const Point2d& p) const { return x == p.x && y == p.y; }
    bool operator!=(const Point2d& p) const { return !(*this == p); }
};

// =============================================================================
// Box2i
// =============================================================================

/**
 * @brief Integer pixel box with inclusive bounds
 *
 * A box is empty when xMax < xMin or yMax < yMin.
 */
struct Box2i {
    int32_t xMin = 0;
    int32_t xMax = -1;
    int32_t yMin = 0;
    int32_t yMax = -1;

    Box2i() = default;
    Box2i(int32_t xMin_, int32_t xMax_, int32_t yMin_, int32_t yMax_)
        : xMin(xMin_), xMax(xMax_), yMin(yMin_), yMax(yMax_) {}

    bool Empty() const { return xMax < xMin || yMax < yMin; }

    /// Extents saturate at INT32_MAX; Area() is exact
    int32_t Width() const { return Saturate(Extent(xMin, xMax)); }
    int32_t Height() const { return Saturate(Extent(yMin, yMax)); }
    int64_t Area() const { return Extent(xMin, xMax) * Extent(yMin, yMax); }

    bool Contains(int32_t x, int32_t y) const {
        return x >= xMin && x <= xMax && y >= yMin && y <= yMax;
    }

    /// Overlapping index range (may be empty)
    Box2i Intersect(const Box2i& other) const {
        return Box2i(std::max(xMin, other.xMin), std::min(xMax, other.xMax),
                     std::max(yMin, other.yMin), std::min(yMax, other.yMax));
    }

    bool operator==(const Box2i& b) const {
        if (Empty() && b.Empty()) return true;
        return xMin == b.xMin && xMax == b.xMax && yMin == b.yMin && yMax == b.yMax;
    }
    bool operator!=(const Box2i& b) const { return !(*this == b); }

private:
    static int64_t Extent(int32_t lo, int32_t hi) {
        return hi < lo ? 0 : static_cast<int64_t>(hi) - lo + 1;
    }
    static int32_t Saturate(int64_t v) {
        return static_cast<int32_t>(std::min<int64_t>(v, std::numeric_limits<int32_t>::max()));
    }
};

} // namespace Ap::Phot
