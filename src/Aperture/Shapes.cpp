/**
 * @file Shapes.cpp
 * @brief Bounds, pixel classification and overlap for the aperture shapes
 */

#include <ApPhot/Aperture/Shapes.h>
#include <ApPhot/Internal/Overlap.h>
#include <ApPhot/Core/Constants.h>
#include <ApPhot/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace Ap::Phot {

namespace {

void CheckFinite(const char* name, double value) {
    if (!std::isfinite(value)) {
        std::ostringstream oss;
        oss << name << " must be finite, got " << value;
        throw InvalidArgumentException(oss.str());
    }
}

void CheckSize(const char* name, double value) {
    CheckFinite(name, value);
    if (value < 0.0) {
        std::ostringstream oss;
        oss << name << " must be non-negative, got " << value;
        throw InvalidArgumentException(oss.str());
    }
}

void CheckOrder(const char* innerName, double inner, const char* outerName, double outer) {
    if (outer < inner) {
        std::ostringstream oss;
        oss << outerName << " (" << outer << ") must be >= " << innerName << " (" << inner << ")";
        throw InvalidArgumentException(oss.str());
    }
}

// Inner secondary axis of a similar annulus
double ScaledInner(double inner, double outer, double outerSecondary) {
    return outer > 0.0 ? inner / outer * outerSecondary : 0.0;
}

// Pixels whose square overlaps the open interval (lo, hi). A degenerate
// interval still keeps the pixel containing its position. Indices are
// clamped to +-MAX_PIXEL_INDEX so huge or far-off shapes stay representable.
void TightRange(double lo, double hi, int32_t& iMin, int32_t& iMax) {
    const double limit = static_cast<double>(MAX_PIXEL_INDEX);
    iMin = static_cast<int32_t>(std::floor(std::clamp(lo + 0.5, -limit, limit)));
    iMax = static_cast<int32_t>(std::ceil(std::clamp(hi - 0.5, -limit, limit)));
    if (iMax < iMin) iMin = iMax;
}

Box2i TightBounds(const Point2d& c, double dx, double dy) {
    Box2i box;
    TightRange(c.x - dx, c.x + dx, box.xMin, box.xMax);
    TightRange(c.y - dy, c.y + dy, box.yMin, box.yMax);
    return box;
}

// Distance from p to the nearest point of pixel (x, y)
double DistanceToPixel(const Point2d& p, int32_t x, int32_t y) {
    double nx = Clamp(p.x, x - 0.5, x + 0.5);
    double ny = Clamp(p.y, y - 0.5, y + 0.5);
    return std::hypot(p.x - nx, p.y - ny);
}

// All four pixel corners satisfy the shape's strict inside test
template<typename S>
bool CornersInside(const S& shape, int32_t x, int32_t y) {
    double dx = x - shape.Center().x;
    double dy = y - shape.Center().y;
    return shape.Contains(dx - 0.5, dy - 0.5) && shape.Contains(dx + 0.5, dy - 0.5) &&
           shape.Contains(dx + 0.5, dy + 0.5) && shape.Contains(dx - 0.5, dy + 0.5);
}

template<typename S>
double SubpixelFraction(const S& shape, int32_t x, int32_t y, int32_t subpixels) {
    double dx = x - shape.Center().x;
    double dy = y - shape.Center().y;
    return Internal::SubpixelOverlap(dx - 0.5, dy - 0.5, dx + 0.5, dy + 0.5, subpixels,
                                     [&shape](double u, double v) { return shape.Contains(u, v); });
}

template<typename S>
double WeightFromFlag(const S& shape, int32_t x, int32_t y, const OverlapMethod& method) {
    switch (shape.Classify(x, y)) {
        case PixelFlag::Inside:  return 1.0;
        case PixelFlag::Outside: return 0.0;
        case PixelFlag::Partial: return shape.PartialOverlap(x, y, method);
    }
    return 0.0;
}

template<typename S>
PixelFlag CombineAnnulus(const S& inner, const S& outer, int32_t x, int32_t y) {
    PixelFlag in = inner.Classify(x, y);
    PixelFlag out = outer.Classify(x, y);
    if (out == PixelFlag::Outside || in == PixelFlag::Inside) return PixelFlag::Outside;
    if (out == PixelFlag::Inside && in == PixelFlag::Outside) return PixelFlag::Inside;
    return PixelFlag::Partial;
}

template<typename S>
double AnnulusOverlap(const S& inner, const S& outer, int32_t x, int32_t y,
                      const OverlapMethod& method) {
    double w = outer.Weight(x, y, method) - inner.Weight(x, y, method);
    return Clamp(w, 0.0, 1.0);
}

} // anonymous namespace

// =============================================================================
// CircularAperture
// =============================================================================

CircularAperture::CircularAperture(double x, double y, double r)
    : center_(x, y), r_(r) {
    CheckFinite("x", x);
    CheckFinite("y", y);
    CheckSize("r", r);
}

Box2i CircularAperture::Bounds() const {
    return TightBounds(center_, r_, r_);
}

PixelFlag CircularAperture::Classify(int32_t x, int32_t y) const {
    if (CornersInside(*this, x, y)) return PixelFlag::Inside;
    if (DistanceToPixel(center_, x, y) >= r_) return PixelFlag::Outside;
    return PixelFlag::Partial;
}

double CircularAperture::PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const {
    if (!method.IsExact()) {
        return SubpixelFraction(*this, x, y, method.Subpixels());
    }
    double dx = x - center_.x;
    double dy = y - center_.y;
    return Internal::CircularOverlapExact(dx - 0.5, dy - 0.5, dx + 0.5, dy + 0.5, r_);
}

double CircularAperture::Weight(int32_t x, int32_t y, const OverlapMethod& method) const {
    return WeightFromFlag(*this, x, y, method);
}

double CircularAperture::Area() const {
    return PI * r_ * r_;
}

std::string CircularAperture::ToString() const {
    std::ostringstream oss;
    oss << "CircularAperture(" << center_.x << ", " << center_.y << ", r=" << r_ << ")";
    return oss.str();
}

// =============================================================================
// CircularAnnulus
// =============================================================================

CircularAnnulus::CircularAnnulus(double x, double y, double rIn, double rOut)
    : inner_(x, y, rIn), outer_(x, y, rOut) {
    CheckOrder("rIn", rIn, "rOut", rOut);
}

PixelFlag CircularAnnulus::Classify(int32_t x, int32_t y) const {
    return CombineAnnulus(inner_, outer_, x, y);
}

double CircularAnnulus::PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const {
    return AnnulusOverlap(inner_, outer_, x, y, method);
}

double CircularAnnulus::Weight(int32_t x, int32_t y, const OverlapMethod& method) const {
    return WeightFromFlag(*this, x, y, method);
}

double CircularAnnulus::Area() const {
    return outer_.Area() - inner_.Area();
}

std::string CircularAnnulus::ToString() const {
    std::ostringstream oss;
    oss << "CircularAnnulus(" << Center().x << ", " << Center().y
        << ", r_in=" << RIn() << ", r_out=" << ROut() << ")";
    return oss.str();
}

// =============================================================================
// EllipticalAperture
// =============================================================================

EllipticalAperture::EllipticalAperture(double x, double y, double a, double b, double theta)
    : center_(x, y), a_(a), b_(b), theta_(0.0) {
    CheckFinite("x", x);
    CheckFinite("y", y);
    CheckSize("a", a);
    CheckSize("b", b);
    CheckFinite("theta", theta);
    theta_ = NormalizeDegrees(theta);

    if (a_ > 0.0 && b_ > 0.0) {
        double s, c;
        SinCosDeg(theta_, s, c);
        double ia2 = 1.0 / (a_ * a_);
        double ib2 = 1.0 / (b_ * b_);
        cxx_ = c * c * ia2 + s * s * ib2;
        cyy_ = s * s * ia2 + c * c * ib2;
        cxy_ = 2.0 * c * s * (ia2 - ib2);
    }
}

bool EllipticalAperture::Contains(double dx, double dy) const {
    if (!(a_ > 0.0) || !(b_ > 0.0)) return false;
    return cxx_ * dx * dx + cxy_ * dx * dy + cyy_ * dy * dy < 1.0;
}

Box2i EllipticalAperture::Bounds() const {
    double s, c;
    SinCosDeg(theta_, s, c);

    // Parametric angles where x(t) and y(t) are extremal
    double tx = std::atan2(-b_ * s, a_ * c);
    double ty = std::atan2(b_ * c, a_ * s);
    double dx = std::abs(a_ * std::cos(tx) * c - b_ * std::sin(tx) * s);
    double dy = std::abs(a_ * std::cos(ty) * s + b_ * std::sin(ty) * c);
    return TightBounds(center_, dx, dy);
}

PixelFlag EllipticalAperture::Classify(int32_t x, int32_t y) const {
    if (CornersInside(*this, x, y)) return PixelFlag::Inside;
    if (!(a_ > 0.0) || !(b_ > 0.0)) return PixelFlag::Outside;
    if (DistanceToPixel(center_, x, y) >= std::max(a_, b_)) return PixelFlag::Outside;
    return PixelFlag::Partial;
}

double EllipticalAperture::PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const {
    if (!method.IsExact()) {
        return SubpixelFraction(*this, x, y, method.Subpixels());
    }
    double dx = x - center_.x;
    double dy = y - center_.y;
    return Internal::EllipticalOverlapExact(dx - 0.5, dy - 0.5, dx + 0.5, dy + 0.5,
                                            a_, b_, theta_);
}

double EllipticalAperture::Weight(int32_t x, int32_t y, const OverlapMethod& method) const {
    return WeightFromFlag(*this, x, y, method);
}

double EllipticalAperture::Area() const {
    return PI * a_ * b_;
}

std::string EllipticalAperture::ToString() const {
    std::ostringstream oss;
    oss << "EllipticalAperture(" << center_.x << ", " << center_.y
        << ", a=" << a_ << ", b=" << b_ << ", theta=" << theta_ << ")";
    return oss.str();
}

// =============================================================================
// EllipticalAnnulus
// =============================================================================

EllipticalAnnulus::EllipticalAnnulus(double x, double y, double aIn, double aOut,
                                     double bOut, double theta)
    : inner_(x, y, aIn, ScaledInner(aIn, aOut, bOut), theta),
      outer_(x, y, aOut, bOut, theta) {
    CheckOrder("aIn", aIn, "aOut", aOut);
}

PixelFlag EllipticalAnnulus::Classify(int32_t x, int32_t y) const {
    return CombineAnnulus(inner_, outer_, x, y);
}

double EllipticalAnnulus::PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const {
    return AnnulusOverlap(inner_, outer_, x, y, method);
}

double EllipticalAnnulus::Weight(int32_t x, int32_t y, const OverlapMethod& method) const {
    return WeightFromFlag(*this, x, y, method);
}

double EllipticalAnnulus::Area() const {
    return outer_.Area() - inner_.Area();
}

std::string EllipticalAnnulus::ToString() const {
    std::ostringstream oss;
    oss << "EllipticalAnnulus(" << Center().x << ", " << Center().y
        << ", a_in=" << AIn() << ", a_out=" << AOut()
        << ", b_in=" << BIn() << ", b_out=" << BOut()
        << ", theta=" << Theta() << ")";
    return oss.str();
}

// =============================================================================
// RectangularAperture
// =============================================================================

RectangularAperture::RectangularAperture(double x, double y, double w, double h, double theta)
    : center_(x, y), w_(w), h_(h), theta_(0.0) {
    CheckFinite("x", x);
    CheckFinite("y", y);
    CheckSize("w", w);
    CheckSize("h", h);
    CheckFinite("theta", theta);
    theta_ = NormalizeDegrees(theta);
    SinCosDeg(theta_, sin_, cos_);
}

bool RectangularAperture::Contains(double dx, double dy) const {
    double u = dx * cos_ + dy * sin_;
    double v = -dx * sin_ + dy * cos_;
    return std::abs(u) < 0.5 * w_ && std::abs(v) < 0.5 * h_;
}

Box2i RectangularAperture::Bounds() const {
    double w2 = 0.5 * w_;
    double h2 = 0.5 * h_;
    double dx = std::max(std::abs(w2 * cos_ - h2 * sin_), std::abs(w2 * cos_ + h2 * sin_));
    double dy = std::max(std::abs(w2 * sin_ + h2 * cos_), std::abs(w2 * sin_ - h2 * cos_));
    return TightBounds(center_, dx, dy);
}

PixelFlag RectangularAperture::Classify(int32_t x, int32_t y) const {
    if (CornersInside(*this, x, y)) return PixelFlag::Inside;
    if (!(w_ > 0.0) || !(h_ > 0.0)) return PixelFlag::Outside;

    // Separating axis test on the pixel axes and the rectangle axes
    double dx = x - center_.x;
    double dy = y - center_.y;
    double ac = std::abs(cos_);
    double as = std::abs(sin_);
    double ex = 0.5 * (w_ * ac + h_ * as);
    double ey = 0.5 * (w_ * as + h_ * ac);
    if (std::abs(dx) >= ex + 0.5 || std::abs(dy) >= ey + 0.5) return PixelFlag::Outside;

    double pixelHalf = 0.5 * (ac + as);
    double u = dx * cos_ + dy * sin_;
    double v = -dx * sin_ + dy * cos_;
    if (std::abs(u) >= 0.5 * w_ + pixelHalf || std::abs(v) >= 0.5 * h_ + pixelHalf) {
        return PixelFlag::Outside;
    }
    return PixelFlag::Partial;
}

double RectangularAperture::PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const {
    if (!method.IsExact()) {
        return SubpixelFraction(*this, x, y, method.Subpixels());
    }
    double dx = x - center_.x;
    double dy = y - center_.y;
    return Internal::RectangularOverlapExact(dx - 0.5, dy - 0.5, dx + 0.5, dy + 0.5,
                                             w_, h_, theta_);
}

double RectangularAperture::Weight(int32_t x, int32_t y, const OverlapMethod& method) const {
    return WeightFromFlag(*this, x, y, method);
}

double RectangularAperture::Area() const {
    return w_ * h_;
}

std::string RectangularAperture::ToString() const {
    std::ostringstream oss;
    oss << "RectangularAperture(" << center_.x << ", " << center_.y
        << ", w=" << w_ << ", h=" << h_ << ", theta=" << theta_ << ")";
    return oss.str();
}

// =============================================================================
// RectangularAnnulus
// =============================================================================

RectangularAnnulus::RectangularAnnulus(double x, double y, double wIn, double wOut,
                                       double hOut, double theta)
    : inner_(x, y, wIn, ScaledInner(wIn, wOut, hOut), theta),
      outer_(x, y, wOut, hOut, theta) {
    CheckOrder("wIn", wIn, "wOut", wOut);
}

PixelFlag RectangularAnnulus::Classify(int32_t x, int32_t y) const {
    return CombineAnnulus(inner_, outer_, x, y);
}

double RectangularAnnulus::PartialOverlap(int32_t x, int32_t y, const OverlapMethod& method) const {
    return AnnulusOverlap(inner_, outer_, x, y, method);
}

double RectangularAnnulus::Weight(int32_t x, int32_t y, const OverlapMethod& method) const {
    return WeightFromFlag(*this, x, y, method);
}

double RectangularAnnulus::Area() const {
    return outer_.Area() - inner_.Area();
}

std::string RectangularAnnulus::ToString() const {
    std::ostringstream oss;
    oss << "RectangularAnnulus(" << Center().x << ", " << Center().y
        << ", w_in=" << WIn() << ", w_out=" << WOut()
        << ", h_in=" << HIn() << ", h_out=" << HOut()
        << ", theta=" << Theta() << ")";
    return oss.str();
}

// =============================================================================
// Shape
// =============================================================================

Point2d ShapeCenter(const Shape& shape) {
    return std::visit([](const auto& s) { return s.Center(); }, shape);
}

Box2i ShapeBounds(const Shape& shape) {
    return std::visit([](const auto& s) { return s.Bounds(); }, shape);
}

PixelFlag ClassifyPixel(const Shape& shape, int32_t x, int32_t y) {
    return std::visit([x, y](const auto& s) { return s.Classify(x, y); }, shape);
}

double PixelWeight(const Shape& shape, int32_t x, int32_t y, const OverlapMethod& method) {
    return std::visit([&](const auto& s) { return s.Weight(x, y, method); }, shape);
}

double ShapeArea(const Shape& shape) {
    return std::visit([](const auto& s) { return s.Area(); }, shape);
}

std::string ShapeToString(const Shape& shape) {
    return std::visit([](const auto& s) { return s.ToString(); }, shape);
}

} // namespace Ap::Phot
