/**
 * @file Polygon.cpp
 * @brief Convex polygon clipping and area
 */

#include <ApPhot/Internal/Polygon.h>
#include <ApPhot/Core/Constants.h>

#include <cmath>

namespace Ap::Phot::Internal {

namespace {

enum class ClipEdge { Left, Right, Bottom, Top };

bool IsInside(const Point2d& p, ClipEdge edge, double bound) {
    switch (edge) {
        case ClipEdge::Left:   return p.x >= bound;
        case ClipEdge::Right:  return p.x <= bound;
        case ClipEdge::Bottom: return p.y >= bound;
        case ClipEdge::Top:    return p.y <= bound;
    }
    return false;
}

// Intersection of segment a-b with the clip line. Only called when a and b
// lie on opposite sides, so the denominator is nonzero.
Point2d Intersect(const Point2d& a, const Point2d& b, ClipEdge edge, double bound) {
    if (edge == ClipEdge::Left || edge == ClipEdge::Right) {
        double t = (bound - a.x) / (b.x - a.x);
        return {bound, a.y + t * (b.y - a.y)};
    }
    double t = (bound - a.y) / (b.y - a.y);
    return {a.x + t * (b.x - a.x), bound};
}

Polygon ClipAgainstEdge(const Polygon& input, ClipEdge edge, double bound) {
    Polygon output;
    if (input.empty()) return output;
    output.reserve(input.size() + 1);

    Point2d prev = input.back();
    bool prevInside = IsInside(prev, edge, bound);
    for (const auto& cur : input) {
        bool curInside = IsInside(cur, edge, bound);
        if (curInside) {
            if (!prevInside) {
                output.push_back(Intersect(prev, cur, edge, bound));
            }
            output.push_back(cur);
        } else if (prevInside) {
            output.push_back(Intersect(prev, cur, edge, bound));
        }
        prev = cur;
        prevInside = curInside;
    }
    return output;
}

} // anonymous namespace

std::array<Point2d, 4> RotatedRectCorners(double w, double h, double theta) {
    double sinA, cosA;
    SinCosDeg(theta, sinA, cosA);

    double hw = w * 0.5;
    double hh = h * 0.5;

    // Local corners: (-hw, -hh), (hw, -hh), (hw, hh), (-hw, hh)
    return {
        Point2d(-hw * cosA + hh * sinA, -hw * sinA - hh * cosA),
        Point2d( hw * cosA + hh * sinA,  hw * sinA - hh * cosA),
        Point2d( hw * cosA - hh * sinA,  hw * sinA + hh * cosA),
        Point2d(-hw * cosA - hh * sinA, -hw * sinA + hh * cosA)
    };
}

Polygon ClipPolygonToBox(const Polygon& poly, double xMin, double yMin,
                         double xMax, double yMax) {
    Polygon out = ClipAgainstEdge(poly, ClipEdge::Left, xMin);
    out = ClipAgainstEdge(out, ClipEdge::Right, xMax);
    out = ClipAgainstEdge(out, ClipEdge::Bottom, yMin);
    out = ClipAgainstEdge(out, ClipEdge::Top, yMax);
    return out;
}

double PolygonArea(const Polygon& poly) {
    if (poly.size() < 3) return 0.0;
    double area = 0.0;
    size_t j = poly.size() - 1;
    for (size_t i = 0; i < poly.size(); ++i) {
        area += (poly[j].x + poly[i].x) * (poly[j].y - poly[i].y);
        j = i;
    }
    return std::abs(area) * 0.5;
}

} // namespace Ap::Phot::Internal
