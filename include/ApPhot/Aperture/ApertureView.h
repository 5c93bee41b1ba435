#pragma once

/**
 * @file ApertureView.h
 * @brief Indexable, lazily evaluated weight field of an aperture
 *
 * An ApertureView pairs a Shape with an OverlapMethod and behaves like a 2D
 * array of weights over the shape's bounding box. Weights are computed on
 * every access; nothing is cached.
 *
 * Example:
 * @code
 * ApertureView ap(CircularAperture(50, 50, 3));
 * double w = ap(47, 50);                  // weight of pixel (47, 50)
 * Array2D<double> cutout = ap * image;    // weighted cutout
 * @endcode
 */

#include <ApPhot/Aperture/ApertureTypes.h>
#include <ApPhot/Aperture/Shapes.h>
#include <ApPhot/Core/Array2D.h>
#include <ApPhot/Core/Types.h>

#include <cstdint>
#include <string>
#include <utility>

namespace Ap::Phot {

class ApertureView {
public:
    ApertureView(Shape shape, OverlapMethod method = OverlapMethod::Exact())
        : shape_(std::move(shape)), method_(method) {}

    const Shape& GetShape() const { return shape_; }
    const OverlapMethod& Method() const { return method_; }

    /// Copy of this view with a different overlap method
    ApertureView WithMethod(const OverlapMethod& method) const {
        return ApertureView(shape_, method);
    }

    Box2i Bounds() const { return ShapeBounds(shape_); }
    int32_t Width() const { return Bounds().Width(); }
    int32_t Height() const { return Bounds().Height(); }
    Point2d Center() const { return ShapeCenter(shape_); }

    /// Analytic area of the shape
    double Area() const { return ShapeArea(shape_); }

    /**
     * @brief Weight of pixel (x, y) in [0, 1]
     *
     * Coordinates outside Bounds() give 0.
     */
    double operator()(int32_t x, int32_t y) const;

    /// Weights over Bounds() as a dense array (origin at the box corner)
    Array2D<double> Materialize() const;

    /// e.g. "CircularAperture(50, 50, r=3)" or "Subpixel(CircularAperture(...), 5)"
    std::string ToString() const;

private:
    Shape shape_;
    OverlapMethod method_;
};

// =============================================================================
// Weighted Cutouts
// =============================================================================

/**
 * @brief weight * data over the intersection of the view's box and the
 *        array's index range
 *
 * The result keeps the intersection's origin, so indices match the image.
 * An empty intersection gives an empty array.
 */
template<typename T>
Array2D<double> Multiply(const ApertureView& view, const Array2D<T>& data);

template<typename T>
Array2D<double> Multiply(const Array2D<T>& data, const ApertureView& view) {
    return Multiply(view, data);
}

template<typename T>
Array2D<double> operator*(const ApertureView& view, const Array2D<T>& data) {
    return Multiply(view, data);
}

template<typename T>
Array2D<double> operator*(const Array2D<T>& data, const ApertureView& view) {
    return Multiply(view, data);
}

} // namespace Ap::Phot
