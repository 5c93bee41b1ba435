/**
 * @file Photometry.cpp
 * @brief Weighted aperture sums, error propagation and multi-aperture tables
 */

#include <ApPhot/Photometry/Photometry.h>
#include <ApPhot/Core/Constants.h>
#include <ApPhot/Core/Exception.h>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <exception>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Ap::Phot {

namespace {

void CheckErrorShape(const Box2i& data, const Box2i& error) {
    if (data != error) {
        throw InvalidArgumentException(
            "error array must cover the same indices as the data array");
    }
}

/**
 * @brief Measure one aperture
 *
 * @param error  Optional error array (nullptr when absent)
 */
template<typename T>
PhotometryResult MeasureAperture(const ApertureView& aperture, const Array2D<T>& data,
                                 const Array2D<T>* error, const PhotometryParams& params) {
    PhotometryResult result;
    Point2d center = aperture.Center();
    result.xCenter = center.x;
    result.yCenter = center.y;

    // Callers have already checked that error shares data's bounds
    Box2i box = aperture.Bounds().Intersect(data.Bounds());

    if (box.Empty()) {
        result.apertureSum = 0.0;
        if (error != nullptr) result.apertureSumErr = NaN;
        if (params.reduction) result.apertureF = 0.0;
        return result;
    }

    const Shape& shape = aperture.GetShape();
    const OverlapMethod& method = aperture.Method();

    // Weighted cutout only when someone will reduce it
    Array2D<double> cutout;
    if (params.reduction) {
        cutout = Array2D<double>(box.Width(), box.Height(), 0.0, box.xMin, box.yMin);
    }

    double sum = 0.0;
    double variance = 0.0;
#ifdef _OPENMP
    // Large apertures split their rows, unless already inside a parallel loop
    bool parallelRows = box.Area() > PARALLEL_PIXEL_THRESHOLD && omp_in_parallel() == 0;
    #pragma omp parallel for reduction(+:sum, variance) schedule(static) if(parallelRows)
#endif
    for (int32_t y = box.yMin; y <= box.yMax; ++y) {
        for (int32_t x = box.xMin; x <= box.xMax; ++x) {
            double w = PixelWeight(shape, x, y, method);
            if (w == 0.0) continue;

            double value = w * static_cast<double>(data(x, y));
            sum += value;
            if (error != nullptr) {
                double e = static_cast<double>((*error)(x, y));
                variance += w * e * e;
            }
            if (params.reduction) {
                cutout(x, y) = value;
            }
        }
    }

    result.apertureSum = sum;
    if (error != nullptr) result.apertureSumErr = std::sqrt(variance);
    if (params.reduction) result.apertureF = params.reduction(cutout);
    return result;
}

template<typename T>
PhotometryTable MeasureApertures(const std::vector<ApertureView>& apertures,
                                 const Array2D<T>& data, const Array2D<T>* error,
                                 const PhotometryParams& params) {
#ifdef APPHOT_DEBUG
    auto t0 = std::chrono::high_resolution_clock::now();
#endif

    const int64_t count = static_cast<int64_t>(apertures.size());
    std::vector<PhotometryResult> rows(apertures.size());
    // Exceptions cannot leave an OpenMP region; keep them per aperture
    std::vector<std::exception_ptr> failures(apertures.size());

#ifdef _OPENMP
    int32_t numThreads = params.numThreads > 0 ? params.numThreads : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(numThreads)
#endif
    for (int64_t i = 0; i < count; ++i) {
        try {
            rows[i] = MeasureAperture(apertures[i], data, error, params);
        } catch (...) {
            failures[i] = std::current_exception();
        }
    }

    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }

#ifdef APPHOT_DEBUG
    auto t1 = std::chrono::high_resolution_clock::now();
    fprintf(stderr, "[Photometry] apertures=%zu, image=%dx%d, time=%.3f ms\n",
            apertures.size(), data.Width(), data.Height(),
            std::chrono::duration<double, std::milli>(t1 - t0).count());
#endif

    return PhotometryTable(std::move(rows), error != nullptr,
                           static_cast<bool>(params.reduction));
}

} // anonymous namespace

// =============================================================================
// PhotometryTable
// =============================================================================

std::vector<std::string> PhotometryTable::ColumnNames() const {
    std::vector<std::string> names = {"xcenter", "ycenter", "aperture_sum"};
    if (hasErrors_) names.push_back("aperture_sum_err");
    if (hasCustom_) names.push_back("aperture_f");
    return names;
}

std::vector<double> PhotometryTable::Column(const std::string& name) const {
    std::vector<double> values;
    values.reserve(rows_.size());

    if (name == "xcenter") {
        for (const auto& r : rows_) values.push_back(r.xCenter);
    } else if (name == "ycenter") {
        for (const auto& r : rows_) values.push_back(r.yCenter);
    } else if (name == "aperture_sum") {
        for (const auto& r : rows_) values.push_back(r.apertureSum);
    } else if (name == "aperture_sum_err" && hasErrors_) {
        for (const auto& r : rows_) values.push_back(r.apertureSumErr.value_or(NaN));
    } else if (name == "aperture_f" && hasCustom_) {
        for (const auto& r : rows_) values.push_back(r.apertureF.value_or(NaN));
    } else {
        throw InvalidArgumentException("no column '" + name + "' in photometry table");
    }
    return values;
}

// =============================================================================
// Photometry
// =============================================================================

template<typename T>
PhotometryResult Photometry(const ApertureView& aperture, const Array2D<T>& data,
                            const PhotometryParams& params) {
    return MeasureAperture<T>(aperture, data, nullptr, params);
}

template<typename T>
PhotometryResult Photometry(const ApertureView& aperture, const Array2D<T>& data,
                            const Array2D<T>& error, const PhotometryParams& params) {
    CheckErrorShape(data.Bounds(), error.Bounds());
    return MeasureAperture<T>(aperture, data, &error, params);
}

template<typename T>
PhotometryTable Photometry(const std::vector<ApertureView>& apertures, const Array2D<T>& data,
                           const PhotometryParams& params) {
    return MeasureApertures<T>(apertures, data, nullptr, params);
}

template<typename T>
PhotometryTable Photometry(const std::vector<ApertureView>& apertures, const Array2D<T>& data,
                           const Array2D<T>& error, const PhotometryParams& params) {
    CheckErrorShape(data.Bounds(), error.Bounds());
    return MeasureApertures<T>(apertures, data, &error, params);
}

// =============================================================================
// Explicit Instantiation
// =============================================================================

#define APPHOT_INSTANTIATE_PHOTOMETRY(T)                                                       \
    template PhotometryResult Photometry(const ApertureView&, const Array2D<T>&,               \
                                         const PhotometryParams&);                              \
    template PhotometryResult Photometry(const ApertureView&, const Array2D<T>&,               \
                                         const Array2D<T>&, const PhotometryParams&);           \
    template PhotometryTable Photometry(const std::vector<ApertureView>&, const Array2D<T>&,   \
                                        const PhotometryParams&);                               \
    template PhotometryTable Photometry(const std::vector<ApertureView>&, const Array2D<T>&,   \
                                        const Array2D<T>&, const PhotometryParams&);

APPHOT_INSTANTIATE_PHOTOMETRY(double)
APPHOT_INSTANTIATE_PHOTOMETRY(float)
APPHOT_INSTANTIATE_PHOTOMETRY(int32_t)
APPHOT_INSTANTIATE_PHOTOMETRY(uint16_t)

#undef APPHOT_INSTANTIATE_PHOTOMETRY

} // namespace Ap::Phot
