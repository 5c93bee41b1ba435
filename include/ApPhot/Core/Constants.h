#pragma once

/**
 * @file Constants.h
 * @brief Mathematical and precision constants for ApPhot
 */

#include <cmath>
#include <cstdint>
#include <limits>

namespace Ap::Phot {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = PI / 2.0;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

// =============================================================================
// Precision Constants
// =============================================================================

/// Tolerance for floating point comparison
constexpr double EPSILON = 1e-9;

/// Tolerance for "point lies on the unit circle" in the triangle/circle kernel
constexpr double ON_CIRCLE_TOLERANCE = 1e-10;

/// Tolerance for generic geometric comparisons (pixels)
constexpr double GEOM_TOLERANCE = 1e-12;

/// Quiet NaN shorthand
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// =============================================================================
// Algorithm Limits
// =============================================================================

/// Default number of samples per axis for subpixel overlap
constexpr int32_t DEFAULT_SUBPIXELS = 5;

/// Apertures with more pixels than this are summed with a parallel row loop
constexpr int64_t PARALLEL_PIXEL_THRESHOLD = 1 << 16;

/// Aperture bounds are clamped to [-MAX_PIXEL_INDEX, MAX_PIXEL_INDEX]
constexpr int32_t MAX_PIXEL_INDEX = 1 << 29;

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Check if two doubles are approximately equal
 */
inline bool ApproxEqual(double a, double b, double epsilon = EPSILON) {
    return std::abs(a - b) <= epsilon;
}

/**
 * @brief Clamp value to range
 */
template<typename T>
inline T Clamp(T value, T minVal, T maxVal) {
    return value < minVal ? minVal : (value > maxVal ? maxVal : value);
}

/**
 * @brief Convert degrees to radians
 */
inline double DegToRad(double degrees) {
    return degrees * DEG_TO_RAD;
}

/**
 * @brief Normalize angle in degrees to [0, 360)
 */
inline double NormalizeDegrees(double degrees) {
    double d = std::fmod(degrees, 360.0);
    if (d < 0.0) d += 360.0;
    if (d >= 360.0) d = 0.0;
    return d;
}

/**
 * @brief Sine and cosine of an angle in degrees
 *
 * Multiples of 90 degrees return exact 0/+-1 so axis-aligned shapes stay
 * axis-aligned.
 */
inline void SinCosDeg(double degrees, double& s, double& c) {
    double d = NormalizeDegrees(degrees);
    if (d == 0.0)   { s = 0.0;  c = 1.0;  return; }
    if (d == 90.0)  { s = 1.0;  c = 0.0;  return; }
    if (d == 180.0) { s = 0.0;  c = -1.0; return; }
    if (d == 270.0) { s = -1.0; c = 0.0;  return; }
    double r = DegToRad(d);
    s = std::sin(r);
    c = std::cos(r);
}

/**
 * @brief Square of a value
 */
template<typename T>
inline T Square(T x) {
    return x * x;
}

/**
 * @brief Square root clamped at zero for tiny negative round-off
 */
inline double SafeSqrt(double x) {
    return x > 0.0 ? std::sqrt(x) : 0.0;
}

} // namespace Ap::Phot
