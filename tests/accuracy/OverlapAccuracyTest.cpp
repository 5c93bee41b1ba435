/**
 * @file OverlapAccuracyTest.cpp
 * @brief Accuracy tests for exact and subpixel pixel overlap
 *
 * Test methodology:
 * 1. Generate random apertures of every shape (random center, size, angle)
 * 2. Sum exact weights over the bounding box and compare with the analytic area
 * 3. Repeat with subpixel sampling for N = 1, 2, 5, 10, 100 and measure the
 *    per-pixel and total-area deviation from the exact result
 *
 * Requirements:
 * - Exact:    |sum - area| < 1e-9 for every aperture
 * - Subpixel: per-pixel deviation < 1.5 / N, total error shrinking with N
 */

#include <ApPhot/Aperture/Shapes.h>
#include <ApPhot/Aperture/ApertureTypes.h>
#include <ApPhot/Core/Constants.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>
#include <random>
#include <string>
#include <vector>

namespace Ap::Phot {
namespace {

// =============================================================================
// Constants
// =============================================================================

constexpr int NUM_TRIALS = 40;
constexpr double EXACT_AREA_TOLERANCE = 1e-9;
constexpr uint32_t SEED = 20240611;

// =============================================================================
// Helpers
// =============================================================================

struct ErrorStats {
    double mean = 0.0;
    double max = 0.0;
    int count = 0;
};

ErrorStats ComputeErrorStats(const std::vector<double>& errors) {
    ErrorStats stats;
    stats.count = static_cast<int>(errors.size());
    if (errors.empty()) return stats;
    stats.mean = std::accumulate(errors.begin(), errors.end(), 0.0) / errors.size();
    stats.max = *std::max_element(errors.begin(), errors.end());
    return stats;
}

void PrintStats(const std::string& label, const ErrorStats& stats) {
    std::cout << std::scientific << std::setprecision(3);
    std::cout << "  " << std::setw(14) << std::left << label
              << " mean=" << stats.mean << "  max=" << stats.max
              << "  (n=" << stats.count << ")\n";
}

class OverlapAccuracyTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937 rng(SEED);
        std::uniform_real_distribution<double> offset(-1.0, 1.0);
        std::uniform_real_distribution<double> angle(0.0, 360.0);
        std::uniform_real_distribution<double> major(2.0, 8.0);
        std::uniform_real_distribution<double> minor(1.0, 5.0);
        std::uniform_real_distribution<double> side(2.0, 10.0);
        std::uniform_real_distribution<double> fraction(0.2, 0.8);

        for (int i = 0; i < NUM_TRIALS; ++i) {
            double cx = offset(rng);
            double cy = offset(rng);
            double theta = angle(rng);
            double r = major(rng);
            double a = major(rng);
            double b = minor(rng);
            double w = side(rng);
            double h = side(rng);
            double f = fraction(rng);

            simple_.push_back(CircularAperture(cx, cy, r));
            simple_.push_back(EllipticalAperture(cx, cy, a, b, theta));
            simple_.push_back(RectangularAperture(cx, cy, w, h, theta));

            annuli_.push_back(CircularAnnulus(cx, cy, f * r, r));
            annuli_.push_back(EllipticalAnnulus(cx, cy, f * a, a, b, theta));
            annuli_.push_back(RectangularAnnulus(cx, cy, f * w, w, h, theta));
        }
    }

    std::vector<Shape> simple_;
    std::vector<Shape> annuli_;
};

double WeightSum(const Shape& shape, const OverlapMethod& method) {
    Box2i box = ShapeBounds(shape);
    double sum = 0.0;
    for (int32_t y = box.yMin; y <= box.yMax; ++y) {
        for (int32_t x = box.xMin; x <= box.xMax; ++x) {
            sum += PixelWeight(shape, x, y, method);
        }
    }
    return sum;
}

// =============================================================================
// Exact Overlap
// =============================================================================

TEST_F(OverlapAccuracyTest, ExactAreaConservation) {
    std::cout << "\n=== Exact Overlap Area Conservation ===" << std::endl;

    std::vector<double> errors;
    for (const auto* group : {&simple_, &annuli_}) {
        for (const auto& shape : *group) {
            double err = std::abs(WeightSum(shape, OverlapMethod::Exact()) - ShapeArea(shape));
            EXPECT_LT(err, EXACT_AREA_TOLERANCE) << ShapeToString(shape);
            errors.push_back(err);
        }
    }
    PrintStats("|sum - area|", ComputeErrorStats(errors));
}

// =============================================================================
// Subpixel Convergence
// =============================================================================

TEST_F(OverlapAccuracyTest, SubpixelConvergesToExact) {
    std::cout << "\n=== Subpixel Convergence ===" << std::endl;

    const std::vector<int32_t> levels = {1, 2, 5, 10, 100};
    double previousMean = std::numeric_limits<double>::infinity();

    for (int32_t n : levels) {
        OverlapMethod method = OverlapMethod::Subpixel(n);
        std::vector<double> pixelErrors;
        std::vector<double> areaErrors;

        for (const auto& shape : simple_) {
            Box2i box = ShapeBounds(shape);
            double sum = 0.0;
            for (int32_t y = box.yMin; y <= box.yMax; ++y) {
                for (int32_t x = box.xMin; x <= box.xMax; ++x) {
                    double w = PixelWeight(shape, x, y, method);
                    double exact = PixelWeight(shape, x, y, OverlapMethod::Exact());
                    pixelErrors.push_back(std::abs(w - exact));
                    sum += w;
                }
            }
            double area = ShapeArea(shape);
            areaErrors.push_back(std::abs(sum - area) / area);
        }

        ErrorStats pixelStats = ComputeErrorStats(pixelErrors);
        ErrorStats areaStats = ComputeErrorStats(areaErrors);
        std::cout << "N=" << n << "\n";
        PrintStats("pixel", pixelStats);
        PrintStats("relative area", areaStats);

        if (n > 1) {
            EXPECT_LT(pixelStats.max, 1.5 / n) << "N=" << n;
        }
        EXPECT_LT(areaStats.mean, previousMean) << "N=" << n;
        previousMean = areaStats.mean;
    }

    EXPECT_LT(previousMean, 1e-4);
}

TEST_F(OverlapAccuracyTest, SubpixelAnnulusArea) {
    std::cout << "\n=== Subpixel Annulus Area (N=100) ===" << std::endl;

    std::vector<double> errors;
    for (const auto& shape : annuli_) {
        double area = ShapeArea(shape);
        double err = std::abs(WeightSum(shape, OverlapMethod::Subpixel(100)) - area) / area;
        EXPECT_LT(err, 2e-3) << ShapeToString(shape);
        errors.push_back(err);
    }
    PrintStats("relative area", ComputeErrorStats(errors));
}

} // anonymous namespace
} // namespace Ap::Phot
