#pragma once

/**
 * @file Shapes.h
 * @brief Aperture shape catalog
 *
 * Six immutable shapes: circle, ellipse and rectangle, each with an annular
 * variant. Angles are in degrees, counter-clockwise from +x, and stored
 * normalized to [0, 360).
 *
 * Every shape answers the same questions about integer pixel (x, y), which
 * covers [x - 0.5, x + 0.5] x [y - 0.5, y + 0.5]:
 * - Bounds():          tight inclusive pixel box of all nonzero weights
 * - Classify(x, y):    Inside / Outside / Partial
 * - PartialOverlap():  overlap fraction computed by the chosen method
 * - Weight(x, y, m):   classification and overlap combined, in [0, 1]
 *
 * Construction throws InvalidArgumentException on negative or non-finite
 * sizes, and on annuli whose outer extent is smaller than the inner one.
 */

#include <ApPhot/Aperture/ApertureTypes.h>
#include <ApPhot/Core/Types.h>

#include <cstdint>
#include <string>
#include <variant>

namespace Ap::Phot {

// =============================================================================
// Circular
// =============================================================================

/**
 * @brief Circle of radius r
 */
class CircularAperture {
public:
    CircularAperture(double x, double y, double r);
    CircularAperture(const Point2d& center, double r) : CircularAperture(center.x, center.y, r) {}

    const Point2d& Center() const { return center_; }
    double R() const { return r_; }

    Box2i Bounds() const;
    PixelFlag Classify(int32_t x, int32_t y) const;
    double PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const;
    double Weight(int32_t x, int32_t y, const OverlapMethod& method) const;

    /// Strict inside test in shape-local coordinates
    bool Contains(double dx, double dy) const { return dx * dx + dy * dy < r_ * r_; }

    double Area() const;
    std::string ToString() const;

private:
    Point2d center_;
    double r_;
};

/**
 * @brief Region between two concentric circles, rIn <= rOut
 */
class CircularAnnulus {
public:
    CircularAnnulus(double x, double y, double rIn, double rOut);
    CircularAnnulus(const Point2d& center, double rIn, double rOut)
        : CircularAnnulus(center.x, center.y, rIn, rOut) {}

    const Point2d& Center() const { return outer_.Center(); }
    double RIn() const { return inner_.R(); }
    double ROut() const { return outer_.R(); }

    Box2i Bounds() const { return outer_.Bounds(); }
    PixelFlag Classify(int32_t x, int32_t y) const;
    double PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const;
    double Weight(int32_t x, int32_t y, const OverlapMethod& method) const;

    bool Contains(double dx, double dy) const {
        return outer_.Contains(dx, dy) && !inner_.Contains(dx, dy);
    }

    double Area() const;
    std::string ToString() const;

private:
    CircularAperture inner_;
    CircularAperture outer_;
};

// =============================================================================
// Elliptical
// =============================================================================

/**
 * @brief Ellipse with semi-major axis a, semi-minor axis b, rotated by theta
 */
class EllipticalAperture {
public:
    EllipticalAperture(double x, double y, double a, double b, double theta = 0.0);
    EllipticalAperture(const Point2d& center, double a, double b, double theta = 0.0)
        : EllipticalAperture(center.x, center.y, a, b, theta) {}

    const Point2d& Center() const { return center_; }
    double A() const { return a_; }
    double B() const { return b_; }
    double Theta() const { return theta_; }

    Box2i Bounds() const;
    PixelFlag Classify(int32_t x, int32_t y) const;
    double PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const;
    double Weight(int32_t x, int32_t y, const OverlapMethod& method) const;

    /// cxx dx^2 + cxy dx dy + cyy dy^2 < 1
    bool Contains(double dx, double dy) const;

    double Area() const;
    std::string ToString() const;

private:
    Point2d center_;
    double a_;
    double b_;
    double theta_;
    // Implicit-form coefficients (zero for a degenerate ellipse)
    double cxx_ = 0.0;
    double cyy_ = 0.0;
    double cxy_ = 0.0;
};

/**
 * @brief Region between two similar, concentric ellipses
 *
 * The inner semi-minor axis is bIn = aIn / aOut * bOut.
 */
class EllipticalAnnulus {
public:
    EllipticalAnnulus(double x, double y, double aIn, double aOut, double bOut,
                      double theta = 0.0);
    EllipticalAnnulus(const Point2d& center, double aIn, double aOut, double bOut,
                      double theta = 0.0)
        : EllipticalAnnulus(center.x, center.y, aIn, aOut, bOut, theta) {}

    const Point2d& Center() const { return outer_.Center(); }
    double AIn() const { return inner_.A(); }
    double AOut() const { return outer_.A(); }
    double BIn() const { return inner_.B(); }
    double BOut() const { return outer_.B(); }
    double Theta() const { return outer_.Theta(); }

    Box2i Bounds() const { return outer_.Bounds(); }
    PixelFlag Classify(int32_t x, int32_t y) const;
    double PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const;
    double Weight(int32_t x, int32_t y, const OverlapMethod& method) const;

    bool Contains(double dx, double dy) const {
        return outer_.Contains(dx, dy) && !inner_.Contains(dx, dy);
    }

    double Area() const;
    std::string ToString() const;

private:
    EllipticalAperture inner_;
    EllipticalAperture outer_;
};

// =============================================================================
// Rectangular
// =============================================================================

/**
 * @brief Rectangle of full width w and height h, rotated by theta
 */
class RectangularAperture {
public:
    RectangularAperture(double x, double y, double w, double h, double theta = 0.0);
    RectangularAperture(const Point2d& center, double w, double h, double theta = 0.0)
        : RectangularAperture(center.x, center.y, w, h, theta) {}

    const Point2d& Center() const { return center_; }
    double W() const { return w_; }
    double H() const { return h_; }
    double Theta() const { return theta_; }

    Box2i Bounds() const;
    PixelFlag Classify(int32_t x, int32_t y) const;
    double PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const;
    double Weight(int32_t x, int32_t y, const OverlapMethod& method) const;

    /// |u| < w/2 and |v| < h/2 in the rotated frame
    bool Contains(double dx, double dy) const;

    double Area() const;
    std::string ToString() const;

private:
    Point2d center_;
    double w_;
    double h_;
    double theta_;
    double sin_ = 0.0;
    double cos_ = 1.0;
};

/**
 * @brief Region between two similar, concentric rectangles
 *
 * The inner height is hIn = wIn / wOut * hOut.
 */
class RectangularAnnulus {
public:
    RectangularAnnulus(double x, double y, double wIn, double wOut, double hOut,
                       double theta = 0.0);
    RectangularAnnulus(const Point2d& center, double wIn, double wOut, double hOut,
                       double theta = 0.0)
        : RectangularAnnulus(center.x, center.y, wIn, wOut, hOut, theta) {}

    const Point2d& Center() const { return outer_.Center(); }
    double WIn() const { return inner_.W(); }
    double WOut() const { return outer_.W(); }
    double HIn() const { return inner_.H(); }
    double HOut() const { return outer_.H(); }
    double Theta() const { return outer_.Theta(); }

    Box2i Bounds() const { return outer_.Bounds(); }
    PixelFlag Classify(int32_t x, int32_t y) const;
    double PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const;
    double Weight(int32_t x, int32_t y, const OverlapMethod& method) const;

    bool Contains(double dx, double dy) const {
        return outer_.Contains(dx, dy) && !inner_.Contains(dx, dy);
    }

    double Area() const;
    std::string ToString() const;

private:
    RectangularAperture inner_;
    RectangularAperture outer_;
};

// =============================================================================
// Shape
// =============================================================================

/// Closed set of aperture shapes
using Shape = std::variant<CircularAperture, CircularAnnulus,
                           EllipticalAperture, EllipticalAnnulus,
                           RectangularAperture, RectangularAnnulus>;

Point2d ShapeCenter(const Shape& shape);
Box2i ShapeBounds(const Shape& shape);
PixelFlag ClassifyPixel(const Shape& shape, int32_t x, int32_t y);
double PixelWeight(const Shape& shape, int32_t x, int32_t y, const OverlapMethod& method);
double ShapeArea(const Shape& shape);
std::string ShapeToString(const Shape& shape);

} // namespace Ap::Phot
