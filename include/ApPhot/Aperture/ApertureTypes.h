#pragma once

/**
 * @file ApertureTypes.h
 * @brief Aperture module type definitions
 *
 * Provides:
 * - Pixel classification flags
 * - Overlap method (exact / subpixel / center)
 * - String parsing utilities for overlap methods
 */

#include <cstdint>
#include <string>

namespace Ap::Phot {

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Position of a pixel relative to an aperture boundary
 */
enum class PixelFlag {
    Inside,         ///< Pixel fully covered (weight 1)
    Outside,        ///< Pixel disjoint from the aperture (weight 0)
    Partial         ///< Boundary may cross the pixel (weight from overlap kernel)
};

/**
 * @brief Overlap computation mode
 */
enum class OverlapMode {
    Exact,          ///< Analytic area
    Subpixel        ///< N x N point sampling per pixel
};

// =============================================================================
// OverlapMethod
// =============================================================================

/**
 * @brief How partial pixels are weighted
 *
 * Subpixel(1) samples only the pixel center ("center" mode).
 */
class OverlapMethod {
public:
    /// Exact analytic overlap (default)
    OverlapMethod() = default;

    static OverlapMethod Exact() { return OverlapMethod(); }

    /**
     * @brief N x N sampling per pixel
     * @throws InvalidArgumentException if subpixels < 1
     */
    static OverlapMethod Subpixel(int32_t subpixels);

    /// Pixel-center sampling, same as Subpixel(1)
    static OverlapMethod Center() { return Subpixel(1); }

    OverlapMode Mode() const { return mode_; }
    int32_t Subpixels() const { return subpixels_; }
    bool IsExact() const { return mode_ == OverlapMode::Exact; }

    bool operator==(const OverlapMethod& other) const {
        return mode_ == other.mode_ && subpixels_ == other.subpixels_;
    }
    bool operator!=(const OverlapMethod& other) const { return !(*this == other); }

private:
    OverlapMethod(OverlapMode mode, int32_t subpixels) : mode_(mode), subpixels_(subpixels) {}

    OverlapMode mode_ = OverlapMode::Exact;
    int32_t subpixels_ = 1;
};

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Parse an overlap method string
 * @param method "exact", "center" or "subpixel" (case insensitive)
 * @param subpixels Samples per axis, used by "subpixel"
 * @throws InvalidArgumentException for an unknown string or subpixels < 1
 */
OverlapMethod ParseOverlapMethod(const std::string& method, int32_t subpixels = 5);

/**
 * @brief Convert overlap method to string ("exact", "center", "subpixel(N)")
 */
std::string OverlapMethodToString(const OverlapMethod& method);

/**
 * @brief Convert pixel flag to string
 */
std::string PixelFlagToString(PixelFlag flag);

} // namespace Ap::Phot
