/**
 * @file test_shapes.cpp
 * @brief Unit tests for the aperture shape catalog
 */

#include <ApPhot/Aperture/Shapes.h>
#include <ApPhot/Aperture/ApertureTypes.h>
#include <ApPhot/Core/Constants.h>
#include <ApPhot/Core/Exception.h>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace Ap::Phot;

namespace {

constexpr double TOL = 1e-10;

// Sum of weights over the bounding box
double WeightSum(const Shape& shape, const OverlapMethod& method = OverlapMethod::Exact()) {
    Box2i box = ShapeBounds(shape);
    double sum = 0.0;
    for (int32_t y = box.yMin; y <= box.yMax; ++y) {
        for (int32_t x = box.xMin; x <= box.xMax; ++x) {
            sum += PixelWeight(shape, x, y, method);
        }
    }
    return sum;
}

} // anonymous namespace

// =============================================================================
// Overlap Method
// =============================================================================

class OverlapMethodTest : public ::testing::Test {};

TEST_F(OverlapMethodTest, Construction) {
    EXPECT_TRUE(OverlapMethod::Exact().IsExact());
    EXPECT_EQ(OverlapMethod::Subpixel(7).Subpixels(), 7);
    EXPECT_EQ(OverlapMethod::Subpixel(7).Mode(), OverlapMode::Subpixel);
    EXPECT_EQ(OverlapMethod::Center(), OverlapMethod::Subpixel(1));
    EXPECT_NE(OverlapMethod::Center(), OverlapMethod::Exact());
    EXPECT_THROW(OverlapMethod::Subpixel(0), InvalidArgumentException);
    EXPECT_THROW(OverlapMethod::Subpixel(-3), InvalidArgumentException);
}

TEST_F(OverlapMethodTest, Parse) {
    EXPECT_EQ(ParseOverlapMethod("exact"), OverlapMethod::Exact());
    EXPECT_EQ(ParseOverlapMethod("Center"), OverlapMethod::Center());
    EXPECT_EQ(ParseOverlapMethod("SUBPIXEL"), OverlapMethod::Subpixel(DEFAULT_SUBPIXELS));
    EXPECT_EQ(ParseOverlapMethod("subpixel", 10), OverlapMethod::Subpixel(10));
    EXPECT_THROW(ParseOverlapMethod("fast"), InvalidArgumentException);
    EXPECT_THROW(ParseOverlapMethod("subpixel", 0), InvalidArgumentException);
}

TEST_F(OverlapMethodTest, ToString) {
    EXPECT_EQ(OverlapMethodToString(OverlapMethod::Exact()), "exact");
    EXPECT_EQ(OverlapMethodToString(OverlapMethod::Center()), "center");
    EXPECT_EQ(OverlapMethodToString(OverlapMethod::Subpixel(5)), "subpixel(5)");
    EXPECT_EQ(PixelFlagToString(PixelFlag::Partial), "partial");
}

// =============================================================================
// Construction
// =============================================================================

class ShapeConstructionTest : public ::testing::Test {};

TEST_F(ShapeConstructionTest, NegativeSizesRejected) {
    EXPECT_THROW(CircularAperture(0, 0, -1), InvalidArgumentException);
    EXPECT_THROW(CircularAnnulus(0, 0, -1, 2), InvalidArgumentException);
    EXPECT_THROW(EllipticalAperture(0, 0, 1, -0.5, 0), InvalidArgumentException);
    EXPECT_THROW(EllipticalAnnulus(0, 0, 1, 2, -1, 0), InvalidArgumentException);
    EXPECT_THROW(RectangularAperture(0, 0, -2, 1, 0), InvalidArgumentException);
    EXPECT_THROW(RectangularAnnulus(0, 0, 1, 2, -3, 0), InvalidArgumentException);
}

TEST_F(ShapeConstructionTest, NonFiniteRejected) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(CircularAperture(0, 0, nan), InvalidArgumentException);
    EXPECT_THROW(CircularAperture(nan, 0, 1), InvalidArgumentException);
    EXPECT_THROW(EllipticalAperture(0, 0, inf, 1, 0), InvalidArgumentException);
    EXPECT_THROW(RectangularAperture(0, 0, 1, 1, nan), InvalidArgumentException);
}

TEST_F(ShapeConstructionTest, AnnulusOuterSmallerThanInnerRejected) {
    EXPECT_THROW(CircularAnnulus(0, 0, 3, 2), InvalidArgumentException);
    EXPECT_THROW(EllipticalAnnulus(0, 0, 3, 2, 1, 0), InvalidArgumentException);
    EXPECT_THROW(RectangularAnnulus(0, 0, 3, 2, 1, 0), InvalidArgumentException);
}

TEST_F(ShapeConstructionTest, EqualAnnulusBoundsAllowed) {
    CircularAnnulus ring(10, 10, 2, 2);
    EXPECT_NEAR(ring.Area(), 0.0, TOL);
    EXPECT_NEAR(WeightSum(ring), 0.0, TOL);
}

TEST_F(ShapeConstructionTest, ThetaNormalized) {
    EXPECT_DOUBLE_EQ(EllipticalAperture(0, 0, 2, 1, -30).Theta(), 330.0);
    EXPECT_DOUBLE_EQ(RectangularAperture(0, 0, 2, 1, 400).Theta(), 40.0);
    EXPECT_DOUBLE_EQ(RectangularAnnulus(0, 0, 1, 2, 1, 360).Theta(), 0.0);
}

TEST_F(ShapeConstructionTest, DerivedInnerAxis) {
    EllipticalAnnulus ea(0, 0, 2, 4, 2, 0);
    EXPECT_DOUBLE_EQ(ea.BIn(), 1.0);
    RectangularAnnulus ra(0, 0, 3, 5, 4, 0);
    EXPECT_DOUBLE_EQ(ra.HIn(), 2.4);
    EllipticalAnnulus degenerate(0, 0, 0, 0, 2, 0);
    EXPECT_DOUBLE_EQ(degenerate.BIn(), 0.0);
}

// =============================================================================
// Bounds
// =============================================================================

class ShapeBoundsTest : public ::testing::Test {};

TEST_F(ShapeBoundsTest, Circle) {
    EXPECT_EQ(CircularAperture(50, 50, 3).Bounds(), Box2i(47, 53, 47, 53));
    EXPECT_EQ(CircularAperture(0.5, 0.5, 5).Bounds(), Box2i(-4, 5, -4, 5));
}

TEST_F(ShapeBoundsTest, ZeroSizeKeepsCenterPixel) {
    EXPECT_EQ(CircularAperture(7, 3, 0).Bounds(), Box2i(7, 7, 3, 3));
    EXPECT_EQ(EllipticalAperture(7.2, 3.4, 0, 0, 10).Bounds(), Box2i(7, 7, 3, 3));
    EXPECT_EQ(RectangularAperture(1.5, 1.5, 0, 0, 0).Bounds(), Box2i(1, 1, 1, 1));
}

TEST_F(ShapeBoundsTest, RotatedEllipse) {
    EXPECT_EQ(EllipticalAperture(0, 0, 3, 1, 0).Bounds(), Box2i(-3, 3, -1, 1));
    EXPECT_EQ(EllipticalAperture(0, 0, 3, 1, 90).Bounds(), Box2i(-1, 1, -3, 3));
}

TEST_F(ShapeBoundsTest, RotatedRectangle) {
    EXPECT_EQ(RectangularAperture(1.5, 1.5, 1, 1, 0).Bounds(), Box2i(1, 2, 1, 2));
    EXPECT_EQ(RectangularAperture(0, 0, 10, 4, 0).Bounds(), Box2i(-5, 5, -2, 2));
    EXPECT_EQ(RectangularAperture(0, 0, 10, 4, 90).Bounds(), Box2i(-2, 2, -5, 5));
}

TEST_F(ShapeBoundsTest, AnnulusUsesOuter) {
    EXPECT_EQ(CircularAnnulus(0, 0, 1, 3).Bounds(), CircularAperture(0, 0, 3).Bounds());
}

TEST_F(ShapeBoundsTest, HugeExtentsAreClamped) {
    Box2i huge = CircularAperture(50, 50, 3e9).Bounds();
    EXPECT_EQ(huge, Box2i(-MAX_PIXEL_INDEX, MAX_PIXEL_INDEX, -MAX_PIXEL_INDEX, MAX_PIXEL_INDEX));
    EXPECT_GT(huge.Width(), 0);
    EXPECT_EQ(huge.Area(), static_cast<int64_t>(huge.Width()) * huge.Height());

    Box2i far = CircularAperture(3e9, -3e9, 3).Bounds();
    EXPECT_EQ(far, Box2i(MAX_PIXEL_INDEX, MAX_PIXEL_INDEX, -MAX_PIXEL_INDEX, -MAX_PIXEL_INDEX));
    EXPECT_TRUE(far.Intersect(Box2i(1, 100, 1, 100)).Empty());
}

TEST_F(ShapeBoundsTest, BoundsAreTightAndComplete) {
    std::vector<Shape> shapes = {
        CircularAperture(2.3, -1.6, 2.3),
        EllipticalAperture(0.5, 0.25, 3, 1.2, 33),
        RectangularAperture(-0.3, 0.6, 4.5, 1.3, 70),
        CircularAnnulus(1, 1, 1.5, 2.5),
    };
    for (const auto& shape : shapes) {
        Box2i box = ShapeBounds(shape);
        // No weight outside the box
        for (int32_t y = box.yMin - 2; y <= box.yMax + 2; ++y) {
            for (int32_t x = box.xMin - 2; x <= box.xMax + 2; ++x) {
                if (box.Contains(x, y)) continue;
                EXPECT_EQ(PixelWeight(shape, x, y, OverlapMethod::Exact()), 0.0)
                    << ShapeToString(shape) << " at (" << x << ", " << y << ")";
            }
        }
        // Every edge row and column carries some weight
        double left = 0, right = 0, bottom = 0, top = 0;
        for (int32_t y = box.yMin; y <= box.yMax; ++y) {
            left += PixelWeight(shape, box.xMin, y, OverlapMethod::Exact());
            right += PixelWeight(shape, box.xMax, y, OverlapMethod::Exact());
        }
        for (int32_t x = box.xMin; x <= box.xMax; ++x) {
            bottom += PixelWeight(shape, x, box.yMin, OverlapMethod::Exact());
            top += PixelWeight(shape, x, box.yMax, OverlapMethod::Exact());
        }
        EXPECT_GT(left, 0.0) << ShapeToString(shape);
        EXPECT_GT(right, 0.0) << ShapeToString(shape);
        EXPECT_GT(bottom, 0.0) << ShapeToString(shape);
        EXPECT_GT(top, 0.0) << ShapeToString(shape);
    }
}

// =============================================================================
// Classification
// =============================================================================

class ShapeClassifyTest : public ::testing::Test {};

TEST_F(ShapeClassifyTest, Circle) {
    CircularAperture c(0, 0, 3);
    EXPECT_EQ(c.Classify(0, 0), PixelFlag::Inside);
    EXPECT_EQ(c.Classify(5, 0), PixelFlag::Outside);
    EXPECT_EQ(c.Classify(3, 0), PixelFlag::Partial);
    EXPECT_EQ(c.Classify(3, 3), PixelFlag::Outside);
}

TEST_F(ShapeClassifyTest, SmallShapeInsideOnePixelIsPartial) {
    CircularAperture c(0, 0, 0.1);
    EXPECT_EQ(c.Classify(0, 0), PixelFlag::Partial);
    EXPECT_NEAR(c.Weight(0, 0, OverlapMethod::Exact()), PI * 0.01, TOL);
}

TEST_F(ShapeClassifyTest, ShapeCrossingPixelEdgeWithoutCorners) {
    // No pixel corner is inside, yet each pixel holds half the circle
    CircularAperture c(0.5, 0, 0.2);
    EXPECT_EQ(c.Classify(0, 0), PixelFlag::Partial);
    EXPECT_EQ(c.Classify(1, 0), PixelFlag::Partial);
    EXPECT_NEAR(c.Weight(0, 0, OverlapMethod::Exact()), PI * 0.04 / 2.0, TOL);
    EXPECT_NEAR(c.Weight(1, 0, OverlapMethod::Exact()), PI * 0.04 / 2.0, TOL);

    RectangularAperture r(0.5, 0, 0.4, 0.2, 0);
    EXPECT_EQ(r.Classify(1, 0), PixelFlag::Partial);
    EXPECT_NEAR(r.Weight(1, 0, OverlapMethod::Exact()), 0.04, TOL);

    EllipticalAperture e(0, 0.5, 0.3, 0.1, 0);
    EXPECT_EQ(e.Classify(0, 1), PixelFlag::Partial);
    EXPECT_NEAR(e.Weight(0, 1, OverlapMethod::Exact()), PI * 0.03 / 2.0, TOL);
}

TEST_F(ShapeClassifyTest, ZeroSizeIsOutsideEverywhere) {
    CircularAperture c(3, 3, 0);
    EXPECT_EQ(c.Classify(3, 3), PixelFlag::Outside);
    RectangularAperture r(3, 3, 0, 2, 0);
    EXPECT_EQ(r.Classify(3, 3), PixelFlag::Outside);
    EllipticalAperture e(3, 3, 2, 0, 0);
    EXPECT_EQ(e.Classify(3, 3), PixelFlag::Outside);
}

TEST_F(ShapeClassifyTest, RotatedRectangleSeparatingAxis) {
    // Diamond with vertices at (+-2, 0) and (0, +-2)
    double side = 2.0 * std::sqrt(2.0);
    RectangularAperture r(0, 0, side, side, 45);
    EXPECT_EQ(r.Classify(0, 0), PixelFlag::Inside);
    // Pixel (2, 2) touches the bounding box but not the diamond
    EXPECT_EQ(r.Classify(2, 2), PixelFlag::Outside);
    EXPECT_EQ(r.Classify(2, 0), PixelFlag::Partial);
}

TEST_F(ShapeClassifyTest, CircularAnnulus) {
    CircularAnnulus ring(0, 0, 1, 3);
    EXPECT_EQ(ring.Classify(0, 0), PixelFlag::Outside);   // inside the hole
    EXPECT_EQ(ring.Classify(2, 0), PixelFlag::Inside);
    EXPECT_EQ(ring.Classify(1, 0), PixelFlag::Partial);
    EXPECT_EQ(ring.Classify(3, 0), PixelFlag::Partial);
    EXPECT_EQ(ring.Classify(5, 5), PixelFlag::Outside);
}

TEST_F(ShapeClassifyTest, FlagsAgreeWithKernel) {
    std::vector<Shape> shapes = {
        CircularAperture(0.3, 0.1, 2.7),
        EllipticalAperture(0.5, 0.5, 3, 1.5, 20),
        RectangularAperture(0.25, 0.75, 3, 2, 30),
        EllipticalAnnulus(0, 0, 1, 3, 2, 45),
        RectangularAnnulus(0.5, 0, 2, 5, 3, 10),
    };
    for (const auto& shape : shapes) {
        Box2i box = ShapeBounds(shape);
        for (int32_t y = box.yMin; y <= box.yMax; ++y) {
            for (int32_t x = box.xMin; x <= box.xMax; ++x) {
                double exact = std::visit(
                    [x, y](const auto& s) { return s.PartialOverlap(x, y, OverlapMethod::Exact()); },
                    shape);
                PixelFlag flag = ClassifyPixel(shape, x, y);
                if (flag == PixelFlag::Inside) {
                    EXPECT_NEAR(exact, 1.0, 1e-9) << ShapeToString(shape);
                } else if (flag == PixelFlag::Outside) {
                    EXPECT_NEAR(exact, 0.0, 1e-9) << ShapeToString(shape);
                }
            }
        }
    }
}

// =============================================================================
// Weights
// =============================================================================

class ShapeWeightTest : public ::testing::Test {};

TEST_F(ShapeWeightTest, RectangleAtPixelJunction) {
    RectangularAperture r(1.5, 1.5, 1, 1, 0);
    for (int32_t y = 1; y <= 2; ++y) {
        for (int32_t x = 1; x <= 2; ++x) {
            EXPECT_NEAR(r.Weight(x, y, OverlapMethod::Exact()), 0.25, TOL);
        }
    }
}

TEST_F(ShapeWeightTest, WeightsInUnitInterval) {
    std::vector<Shape> shapes = {
        CircularAnnulus(0.2, 0.4, 1.3, 3.1),
        EllipticalAperture(0, 0, 4, 1, 123),
        RectangularAnnulus(0, 0, 2, 6, 4, 15),
    };
    for (const auto& shape : shapes) {
        Box2i box = ShapeBounds(shape);
        for (int32_t y = box.yMin; y <= box.yMax; ++y) {
            for (int32_t x = box.xMin; x <= box.xMax; ++x) {
                for (const auto& m : {OverlapMethod::Exact(), OverlapMethod::Subpixel(5),
                                      OverlapMethod::Center()}) {
                    double w = PixelWeight(shape, x, y, m);
                    EXPECT_GE(w, 0.0);
                    EXPECT_LE(w, 1.0);
                }
            }
        }
    }
}

TEST_F(ShapeWeightTest, SymmetryAboutGridCenter) {
    CircularAperture c(0, 0, 2.6);
    EllipticalAperture e(0, 0, 3, 2, 0);
    RectangularAperture r(0, 0, 3.4, 2.2, 0);
    for (int32_t y = -3; y <= 3; ++y) {
        for (int32_t x = -3; x <= 3; ++x) {
            double w = c.Weight(x, y, OverlapMethod::Exact());
            EXPECT_NEAR(w, c.Weight(-x, y, OverlapMethod::Exact()), 1e-12);
            EXPECT_NEAR(w, c.Weight(x, -y, OverlapMethod::Exact()), 1e-12);
            EXPECT_NEAR(w, c.Weight(y, x, OverlapMethod::Exact()), 1e-12);

            double we = e.Weight(x, y, OverlapMethod::Exact());
            EXPECT_NEAR(we, e.Weight(-x, -y, OverlapMethod::Exact()), 1e-12);
            EXPECT_NEAR(we, e.Weight(-x, y, OverlapMethod::Exact()), 1e-12);

            double wr = r.Weight(x, y, OverlapMethod::Exact());
            EXPECT_NEAR(wr, r.Weight(-x, -y, OverlapMethod::Exact()), 1e-12);
        }
    }
}

TEST_F(ShapeWeightTest, CenterModeSamplesPixelCenter) {
    CircularAperture c(0, 0, 3);
    EXPECT_EQ(c.Weight(2, 2, OverlapMethod::Center()), 1.0);   // |(2,2)| < 3
    EXPECT_EQ(c.Weight(3, 0, OverlapMethod::Center()), 0.0);   // on the boundary
    EXPECT_EQ(c.Weight(1, 3, OverlapMethod::Center()), 0.0);
}

TEST_F(ShapeWeightTest, AreaConservationAllShapes) {
    struct Case { Shape shape; double area; };
    const std::vector<Case> cases = {
        {CircularAperture(0, 0, 0.3), PI * 0.09},
        {CircularAperture(0, 0, 3), PI * 9},
        {CircularAnnulus(0.5, 0.5, 0.5, 1), PI * (1 - 0.25)},
        {CircularAnnulus(0, 0, 3, 5), PI * (25 - 9)},
        {EllipticalAperture(0, 0, 3, 3, 0), PI * 9},
        {EllipticalAperture(0.3, 0.7, 4, 2, 90), PI * 8},
        {EllipticalAnnulus(0, 0, 0.3, 0.5, 0.5, 0), PI * (0.25 - 0.3 * 0.3)},
        {EllipticalAnnulus(0, 0, 3, 5, 4, 0), PI * (20 - 3 * 2.4)},
        {RectangularAperture(0, 0, 3, 5, 0), 15},
        {RectangularAperture(0.2, 0.4, 3, 5, 37), 15},
        {RectangularAnnulus(0, 0, 0.5, 1, 1, 0), 1 - 0.25},
        {RectangularAnnulus(0, 0, 3, 5, 4, 0), 20 - 3 * 2.4},
    };
    for (const auto& c : cases) {
        EXPECT_NEAR(ShapeArea(c.shape), c.area, 1e-12) << ShapeToString(c.shape);
        EXPECT_NEAR(WeightSum(c.shape), c.area, 1e-9) << ShapeToString(c.shape);
        EXPECT_NEAR(WeightSum(c.shape, OverlapMethod::Subpixel(10)), c.area, 0.1 + 0.05 * c.area)
            << ShapeToString(c.shape);
    }
}

// =============================================================================
// Description
// =============================================================================

TEST(ShapeToStringTest, Formats) {
    EXPECT_EQ(CircularAperture(50, 50, 3).ToString(), "CircularAperture(50, 50, r=3)");
    EXPECT_EQ(CircularAnnulus(1, 2, 3, 4).ToString(), "CircularAnnulus(1, 2, r_in=3, r_out=4)");
    EXPECT_EQ(EllipticalAperture(0, 0, 3, 1, 30).ToString(),
              "EllipticalAperture(0, 0, a=3, b=1, theta=30)");
    EXPECT_EQ(RectangularAperture(0, 0, 10, 4, 0).ToString(),
              "RectangularAperture(0, 0, w=10, h=4, theta=0)");
    EXPECT_EQ(RectangularAnnulus(0, 0, 5, 10, 8, 45).ToString(),
              "RectangularAnnulus(0, 0, w_in=5, w_out=10, h_in=4, h_out=8, theta=45)");
}
