#pragma once

/**
 * @file Photometry.h
 * @brief Aperture photometry: weighted sums with propagated uncertainty
 *
 * Provides:
 * - Photometry():      sum of weight * data over one or many apertures
 * - PhotometryResult:  one measurement (center, sum, optional error / custom)
 * - PhotometryTable:   order-preserving collection of results
 *
 * For an aperture whose box does not intersect the image, the sum is 0, the
 * error (when an error array is given) is NaN, and the custom statistic is 0.
 *
 * Example:
 * @code
 * Array2D<double> image(100, 100, 1.0);
 * ApertureView ap(CircularAperture(50, 50, 3));
 * PhotometryResult r = Photometry(ap, image);   // r.apertureSum == 9 pi
 * @endcode
 */

#include <ApPhot/Aperture/ApertureView.h>
#include <ApPhot/Core/Array2D.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Ap::Phot {

// =============================================================================
// Parameters
// =============================================================================

/// Custom statistic evaluated over the weighted cutout (weight * data)
using Reduction = std::function<double(const Array2D<double>&)>;

/**
 * @brief Parameters for photometry
 */
struct PhotometryParams {
    Reduction reduction;        ///< Optional custom statistic (reported as aperture_f)
    int32_t numThreads = 0;     ///< Threads for multi-aperture runs (0 = all available)

    // Builder pattern
    PhotometryParams& SetReduction(Reduction f) { reduction = std::move(f); return *this; }
    PhotometryParams& SetNumThreads(int32_t n) { numThreads = n; return *this; }
};

// =============================================================================
// Results
// =============================================================================

/**
 * @brief Photometry of a single aperture
 */
struct PhotometryResult {
    double xCenter = 0.0;                   ///< Aperture center x
    double yCenter = 0.0;                   ///< Aperture center y
    double apertureSum = 0.0;               ///< sum(weight * data)
    std::optional<double> apertureSumErr;   ///< sqrt(sum(weight * error^2)), if errors given
    std::optional<double> apertureF;        ///< Custom statistic, if a reduction is given
};

/**
 * @brief Photometry of many apertures, rows in input order
 *
 * Columns: xcenter, ycenter, aperture_sum, and aperture_sum_err /
 * aperture_f when present.
 */
class PhotometryTable {
public:
    PhotometryTable() = default;
    PhotometryTable(std::vector<PhotometryResult> rows, bool hasErrors, bool hasCustom)
        : rows_(std::move(rows)), hasErrors_(hasErrors), hasCustom_(hasCustom) {}

    size_t Size() const { return rows_.size(); }
    bool Empty() const { return rows_.empty(); }
    bool HasErrors() const { return hasErrors_; }
    bool HasCustom() const { return hasCustom_; }

    const PhotometryResult& operator[](size_t i) const { return rows_[i]; }
    const std::vector<PhotometryResult>& Rows() const { return rows_; }

    std::vector<PhotometryResult>::const_iterator begin() const { return rows_.begin(); }
    std::vector<PhotometryResult>::const_iterator end() const { return rows_.end(); }

    std::vector<std::string> ColumnNames() const;

    /**
     * @brief Values of one column
     * @throws InvalidArgumentException for an unknown or absent column
     */
    std::vector<double> Column(const std::string& name) const;

private:
    std::vector<PhotometryResult> rows_;
    bool hasErrors_ = false;
    bool hasCustom_ = false;
};

// =============================================================================
// Photometry
// =============================================================================

/**
 * @brief Photometry of one aperture
 *
 * @tparam T double, float, int32_t or uint16_t
 */
template<typename T>
PhotometryResult Photometry(const ApertureView& aperture, const Array2D<T>& data,
                            const PhotometryParams& params = PhotometryParams());

/**
 * @brief Photometry of one aperture with per-pixel standard deviations
 *
 * @throws InvalidArgumentException if error and data cover different indices
 */
template<typename T>
PhotometryResult Photometry(const ApertureView& aperture, const Array2D<T>& data,
                            const Array2D<T>& error,
                            const PhotometryParams& params = PhotometryParams());

/**
 * @brief Photometry of many apertures, measured in parallel
 *
 * The reduction, if any, may be called concurrently from several threads.
 */
template<typename T>
PhotometryTable Photometry(const std::vector<ApertureView>& apertures, const Array2D<T>& data,
                           const PhotometryParams& params = PhotometryParams());

template<typename T>
PhotometryTable Photometry(const std::vector<ApertureView>& apertures, const Array2D<T>& data,
                           const Array2D<T>& error,
                           const PhotometryParams& params = PhotometryParams());

} // namespace Ap::Phot
