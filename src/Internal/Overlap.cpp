/**
 * @file Overlap.cpp
 * @brief Exact pixel/shape overlap kernels
 */

#include <ApPhot/Internal/Overlap.h>
#include <ApPhot/Internal/Polygon.h>
#include <ApPhot/Core/Constants.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace Ap::Phot::Internal {

namespace {

// Box fully in the first quadrant (xMin, yMin >= 0)
double CircularOverlapCore(double xMin, double yMin, double xMax, double yMax, double r) {
    double r2 = r * r;
    if (xMin * xMin + yMin * yMin >= r2) return 0.0;
    if (xMax * xMax + yMax * yMax <= r2) return (xMax - xMin) * (yMax - yMin);

    double d1 = std::sqrt(xMax * xMax + yMin * yMin);
    double d2 = std::sqrt(xMin * xMin + yMax * yMax);

    if (d1 < r && d2 < r) {
        // Only the far corner is outside
        double x1 = SafeSqrt(r2 - yMax * yMax), y1 = yMax;
        double x2 = xMax, y2 = SafeSqrt(r2 - xMax * xMax);
        return (xMax - xMin) * (yMax - yMin)
             - TriangleArea(x1, y1, x2, y2, xMax, yMax)
             + CircularSegmentArea(x1, y1, x2, y2, r);
    }
    if (d1 < r) {
        // Circle crosses the left and right edges
        double x1 = xMin, y1 = SafeSqrt(r2 - xMin * xMin);
        double x2 = xMax, y2 = SafeSqrt(r2 - xMax * xMax);
        return CircularSegmentArea(x1, y1, x2, y2, r)
             + TriangleArea(x1, y1, x1, yMin, xMax, yMin)
             + TriangleArea(x1, y1, x2, yMin, x2, y2);
    }
    if (d2 < r) {
        // Circle crosses the bottom and top edges
        double x1 = SafeSqrt(r2 - yMin * yMin), y1 = yMin;
        double x2 = SafeSqrt(r2 - yMax * yMax), y2 = yMax;
        return CircularSegmentArea(x1, y1, x2, y2, r)
             + TriangleArea(x1, y1, xMin, y1, xMin, yMax)
             + TriangleArea(x1, y1, xMin, y2, x2, y2);
    }
    // Only the near corner is inside
    double x1 = SafeSqrt(r2 - yMin * yMin), y1 = yMin;
    double x2 = xMin, y2 = SafeSqrt(r2 - xMin * xMin);
    return CircularSegmentArea(x1, y1, x2, y2, r)
         + TriangleArea(x1, y1, x2, y2, xMin, yMin);
}

// Parameters t of |p1 + t (p2 - p1)| = 1, ascending. Tangency counts as a miss.
int32_t UnitCircleRoots(const Point2d& p1, const Point2d& p2, double& t1, double& t2) {
    Point2d d = p2 - p1;
    double dd = d.NormSquared();
    if (dd <= GEOM_TOLERANCE * GEOM_TOLERANCE) return 0;

    double half = p1.Dot(d);
    double disc = half * half - dd * (p1.NormSquared() - 1.0);
    if (disc <= 0.0) return 0;

    double root = std::sqrt(disc);
    t1 = (-half - root) / dd;
    t2 = (-half + root) / dd;
    return 2;
}

// Left of the directed line a -> b
bool LeftOf(const Point2d& p, const Point2d& a, const Point2d& b) {
    return (p.y - a.y) * (b.x - a.x) > (b.y - a.y) * (p.x - a.x);
}

double Triangle(const Point2d& a, const Point2d& b, const Point2d& c) {
    return TriangleArea(a.x, a.y, b.x, b.y, c.x, c.y);
}

double Segment(const Point2d& a, const Point2d& b) {
    return CircularSegmentArea(a.x, a.y, b.x, b.y, 1.0);
}

} // anonymous namespace

// =============================================================================
// Geometric Primitives
// =============================================================================

double TriangleArea(double x0, double y0, double x1, double y1, double x2, double y2) {
    return 0.5 * std::abs(x0 * (y1 - y2) + x1 * (y2 - y0) + x2 * (y0 - y1));
}

double CircularSegmentArea(double x0, double y0, double x1, double y1, double r) {
    if (r <= 0.0) return 0.0;
    double chord = std::hypot(x1 - x0, y1 - y0);
    double theta = 2.0 * std::asin(Clamp(0.5 * chord / r, 0.0, 1.0));
    return 0.5 * r * r * (theta - std::sin(theta));
}

bool PointInTriangle(double x, double y,
                     double x1, double y1, double x2, double y2, double x3, double y3) {
    int32_t crossings = 0;
    if (((y1 > y) != (y2 > y)) && x < (x2 - x1) * (y - y1) / (y2 - y1) + x1) ++crossings;
    if (((y2 > y) != (y3 > y)) && x < (x3 - x2) * (y - y2) / (y3 - y2) + x2) ++crossings;
    if (((y3 > y) != (y1 > y)) && x < (x1 - x3) * (y - y3) / (y1 - y3) + x3) ++crossings;
    return (crossings % 2) == 1;
}

CircleIntersection LineCircleIntersection(const Point2d& p1, const Point2d& p2) {
    CircleIntersection result;
    double t1 = 0.0, t2 = 0.0;
    if (UnitCircleRoots(p1, p2, t1, t2) == 0) return result;

    Point2d d = p2 - p1;
    result.count = 2;
    result.first = p1 + d * t1;
    result.second = p1 + d * t2;
    return result;
}

CircleIntersection SegmentCircleIntersection(const Point2d& p1, const Point2d& p2) {
    CircleIntersection result;
    double t[2] = {0.0, 0.0};
    if (UnitCircleRoots(p1, p2, t[0], t[1]) == 0) return result;

    // Endpoints on the circle must survive round-off in t
    Point2d d = p2 - p1;
    for (double ti : t) {
        if (ti < -ON_CIRCLE_TOLERANCE || ti > 1.0 + ON_CIRCLE_TOLERANCE) continue;
        if (result.count == 0) {
            result.first = p1 + d * ti;
        } else {
            result.second = p1 + d * ti;
        }
        ++result.count;
    }
    return result;
}

Point2d NearestCircleIntersection(const Point2d& p1, const Point2d& p2) {
    CircleIntersection line = LineCircleIntersection(p1, p2);
    if (line.count == 0) return p1;
    double d1 = (line.first - p2).NormSquared();
    double d2 = (line.second - p2).NormSquared();
    return d1 <= d2 ? line.first : line.second;
}

double TriangleUnitCircleOverlap(double x1, double y1, double x2, double y2,
                                 double x3, double y3) {
    std::array<Point2d, 3> p = {Point2d(x1, y1), Point2d(x2, y2), Point2d(x3, y3)};
    std::stable_sort(p.begin(), p.end(), [](const Point2d& a, const Point2d& b) {
        return a.NormSquared() < b.NormSquared();
    });
    const Point2d& v1 = p[0];
    const Point2d& v2 = p[1];
    const Point2d& v3 = p[2];

    double d1 = v1.NormSquared();
    double d2 = v2.NormSquared();
    double d3 = v3.NormSquared();

    bool in1 = d1 < 1.0;
    bool in2 = d2 < 1.0;
    bool in3 = d3 < 1.0;
    bool on1 = std::abs(d1 - 1.0) < ON_CIRCLE_TOLERANCE;
    bool on2 = std::abs(d2 - 1.0) < ON_CIRCLE_TOLERANCE;
    bool on3 = std::abs(d3 - 1.0) < ON_CIRCLE_TOLERANCE;

    if (in3 || on3) {
        return Triangle(v1, v2, v3);
    }

    if (in2 || on2) {
        // A vertex on the circle only leads to a crossing if the edge heads inward
        bool intersect13 = !on1 || v1.Dot(v3 - v1) < 0.0;
        bool intersect23 = !on2 || v2.Dot(v3 - v2) < 0.0;

        if (intersect13 && intersect23) {
            Point2d q1 = NearestCircleIntersection(v1, v3);
            Point2d q2 = NearestCircleIntersection(v2, v3);
            return Triangle(v1, v2, q1) + Triangle(v2, q1, q2) + Segment(q1, q2);
        }
        if (intersect13) {
            Point2d q1 = NearestCircleIntersection(v1, v3);
            return Triangle(v1, v2, q1) + Segment(v2, q1);
        }
        if (intersect23) {
            Point2d q2 = NearestCircleIntersection(v2, v3);
            return Triangle(v1, v2, q2) + Segment(v1, q2);
        }
        return Segment(v1, v2);
    }

    if (in1) {
        CircleIntersection far = SegmentCircleIntersection(v2, v3);
        Point2d q3 = NearestCircleIntersection(v1, v2);
        Point2d q4 = NearestCircleIntersection(v1, v3);

        if (far.count < 2) {
            // The far edge lies beyond the chord q3-q4. If the origin is on the
            // same side, the enclosed arc spans more than half the circle.
            Point2d farMid = (v2 + v3) * 0.5;
            bool longChord = (q3 - q4).NormSquared() > ON_CIRCLE_TOLERANCE;
            if (longChord && LeftOf(Point2d(0.0, 0.0), q3, q4) == LeftOf(farMid, q3, q4)) {
                return Triangle(v1, q3, q4) + PI - Segment(q3, q4);
            }
            return Triangle(v1, q3, q4) + Segment(q3, q4);
        }

        Point2d q1 = far.first;
        Point2d q2 = far.second;
        if ((q2 - v2).NormSquared() < (q1 - v2).NormSquared()) {
            std::swap(q1, q2);
        }
        return Triangle(v1, q3, q1) + Triangle(v1, q1, q2) + Triangle(v1, q2, q4)
             + Segment(q1, q3) + Segment(q2, q4);
    }

    // No vertex inside: split at the midpoint of the first chord found
    const std::array<std::pair<int, int>, 3> edges = {{{0, 1}, {1, 2}, {2, 0}}};
    for (const auto& e : edges) {
        const Point2d& a = p[e.first];
        const Point2d& b = p[e.second];
        CircleIntersection chord = SegmentCircleIntersection(a, b);
        if (chord.count < 2) continue;
        if ((chord.first - chord.second).NormSquared() <= ON_CIRCLE_TOLERANCE) continue;

        Point2d mid = (chord.first + chord.second) * 0.5;
        if (mid.NormSquared() >= 1.0) continue;

        const Point2d& c = p[3 - e.first - e.second];
        return TriangleUnitCircleOverlap(a.x, a.y, c.x, c.y, mid.x, mid.y)
             + TriangleUnitCircleOverlap(b.x, b.y, c.x, c.y, mid.x, mid.y);
    }

    return PointInTriangle(0.0, 0.0, v1.x, v1.y, v2.x, v2.y, v3.x, v3.y) ? PI : 0.0;
}

// =============================================================================
// Exact Pixel Overlap
// =============================================================================

double CircularOverlapExact(double xMin, double yMin, double xMax, double yMax, double r) {
    if (!(r > 0.0)) return 0.0;

    if (xMin >= 0.0) {
        if (yMin >= 0.0) return CircularOverlapCore(xMin, yMin, xMax, yMax, r);
        if (yMax <= 0.0) return CircularOverlapCore(xMin, -yMax, xMax, -yMin, r);
        return CircularOverlapExact(xMin, yMin, xMax, 0.0, r)
             + CircularOverlapExact(xMin, 0.0, xMax, yMax, r);
    }
    if (xMax <= 0.0) {
        if (yMin >= 0.0) return CircularOverlapCore(-xMax, yMin, -xMin, yMax, r);
        if (yMax <= 0.0) return CircularOverlapCore(-xMax, -yMax, -xMin, -yMin, r);
        return CircularOverlapExact(xMin, yMin, xMax, 0.0, r)
             + CircularOverlapExact(xMin, 0.0, xMax, yMax, r);
    }
    return CircularOverlapExact(xMin, yMin, 0.0, yMax, r)
         + CircularOverlapExact(0.0, yMin, xMax, yMax, r);
}

double EllipticalOverlapExact(double xMin, double yMin, double xMax, double yMax,
                              double a, double b, double theta) {
    if (!(a > 0.0) || !(b > 0.0)) return 0.0;

    double sinT, cosT;
    SinCosDeg(theta, sinT, cosT);

    // Rotate by -theta and scale onto the unit circle
    auto toUnit = [&](double x, double y) {
        return Point2d((x * cosT + y * sinT) / a, (-x * sinT + y * cosT) / b);
    };
    Point2d p1 = toUnit(xMin, yMin);
    Point2d p2 = toUnit(xMax, yMin);
    Point2d p3 = toUnit(xMax, yMax);
    Point2d p4 = toUnit(xMin, yMax);

    double unitArea = TriangleUnitCircleOverlap(p1.x, p1.y, p2.x, p2.y, p3.x, p3.y)
                    + TriangleUnitCircleOverlap(p1.x, p1.y, p4.x, p4.y, p3.x, p3.y);
    double area = a * b * unitArea;
    return Clamp(area, 0.0, (xMax - xMin) * (yMax - yMin));
}

double RectangularOverlapExact(double xMin, double yMin, double xMax, double yMax,
                               double w, double h, double theta) {
    if (!(w > 0.0) || !(h > 0.0)) return 0.0;

    auto corners = RotatedRectCorners(w, h, theta);
    Polygon rect(corners.begin(), corners.end());
    Polygon clipped = ClipPolygonToBox(rect, xMin, yMin, xMax, yMax);
    return Clamp(PolygonArea(clipped), 0.0, (xMax - xMin) * (yMax - yMin));
}

} // namespace Ap::Phot::Internal
