/**
 * @file ApertureView.cpp
 * @brief Lazy aperture weight field
 */

#include <ApPhot/Aperture/ApertureView.h>

namespace Ap::Phot {

double ApertureView::operator()(int32_t x, int32_t y) const {
    if (!Bounds().Contains(x, y)) return 0.0;
    return PixelWeight(shape_, x, y, method_);
}

Array2D<double> ApertureView::Materialize() const {
    Box2i box = Bounds();
    Array2D<double> weights(box.Width(), box.Height(), 0.0, box.xMin, box.yMin);
    for (int32_t y = box.yMin; y <= box.yMax; ++y) {
        for (int32_t x = box.xMin; x <= box.xMax; ++x) {
            weights(x, y) = PixelWeight(shape_, x, y, method_);
        }
    }
    return weights;
}

std::string ApertureView::ToString() const {
    std::string shape = ShapeToString(shape_);
    if (method_.IsExact()) return shape;
    return "Subpixel(" + shape + ", " + std::to_string(method_.Subpixels()) + ")";
}

template<typename T>
Array2D<double> Multiply(const ApertureView& view, const Array2D<T>& data) {
    Box2i box = view.Bounds().Intersect(data.Bounds());
    if (box.Empty()) return Array2D<double>();

    Array2D<double> out(box.Width(), box.Height(), 0.0, box.xMin, box.yMin);
    for (int32_t y = box.yMin; y <= box.yMax; ++y) {
        for (int32_t x = box.xMin; x <= box.xMax; ++x) {
            out(x, y) = PixelWeight(view.GetShape(), x, y, view.Method()) *
                        static_cast<double>(data(x, y));
        }
    }
    return out;
}

template Array2D<double> Multiply(const ApertureView&, const Array2D<double>&);
template Array2D<double> Multiply(const ApertureView&, const Array2D<float>&);
template Array2D<double> Multiply(const ApertureView&, const Array2D<int32_t>&);
template Array2D<double> Multiply(const ApertureView&, const Array2D<uint16_t>&);

} // namespace Ap::Phot
