/**
 * @file    test_layout.cpp
 * @brief   Unit tests for layout.hpp
 */

#include "core/layout.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <iterator>
#include <limits>
#include <vector>

using namespace wmk;
using wmk::test::thrown_kind;

namespace {

std::vector<cv::Point> offsets(const Placement& placement) {
    const auto& grid = std::get<TileGrid>(placement);
    return std::vector<cv::Point>(grid.begin(), grid.end());
}

PlacementSpec single_at(Position position, int margin = 0) {
    return PlacementSpec{.mode = WatermarkMode::Single, .position = position, .margin = margin};
}

PlacementSpec tiled(int padding, TileLayout layout = TileLayout::Grid) {
    return PlacementSpec{.mode = WatermarkMode::Tile, .tile_padding = padding, .tile_layout = layout};
}

} // namespace

// =============================================================================
// Watermark size
// =============================================================================

TEST(WatermarkSizeTest, LinearFollowsBaseWidth) {
    EXPECT_EQ(compute_watermark_size({1000, 800}, {200, 100}, RescaleMode::Linear, 0.1),
              cv::Size(100, 50));
    EXPECT_EQ(compute_watermark_size({640, 480}, {64, 64}, RescaleMode::Linear, 1.0),
              cv::Size(640, 640));
}

TEST(WatermarkSizeTest, AreaFollowsBaseArea) {
    // Target area 20000, watermark area 5000 -> scale 2
    EXPECT_EQ(compute_watermark_size({1000, 1000}, {100, 50}, RescaleMode::Area, 0.02),
              cv::Size(200, 100));
}

TEST(WatermarkSizeTest, AspectRatioIsKept) {
    const std::vector<cv::Size> watermarks{{300, 200}, {200, 300}, {97, 61}, {50, 50}};

    for (RescaleMode mode : {RescaleMode::Linear, RescaleMode::Area}) {
        for (const cv::Size& mark : watermarks) {
            for (double p : {0.05, 0.1, 0.25, 0.5, 0.9, 1.0}) {
                const cv::Size out = compute_watermark_size({1920, 1080}, mark, mode, p);
                // Predict the shorter side from the longer one
                if (mark.width >= mark.height) {
                    const double expected = out.width * static_cast<double>(mark.height) / mark.width;
                    EXPECT_LE(std::abs(out.height - expected), 1.0) << mark << " p=" << p;
                } else {
                    const double expected = out.height * static_cast<double>(mark.width) / mark.height;
                    EXPECT_LE(std::abs(out.width - expected), 1.0) << mark << " p=" << p;
                }
            }
        }
    }
}

TEST(WatermarkSizeTest, AreaMatchesRequestedFraction) {
    const cv::Size base(1600, 900);
    for (double p : {0.01, 0.1, 0.3, 0.75}) {
        const cv::Size out = compute_watermark_size(base, {320, 180}, RescaleMode::Area, p);
        const double target = base.area() * p;
        EXPECT_NEAR(static_cast<double>(out.area()), target, 0.5 * (out.width + out.height) + 1.0)
            << "p=" << p;
    }
}

TEST(WatermarkSizeTest, NeverSmallerThanOnePixel) {
    EXPECT_EQ(compute_watermark_size({10, 10}, {1000, 10}, RescaleMode::Linear, 0.01),
              cv::Size(1, 1));
    EXPECT_EQ(compute_watermark_size({2, 2}, {5000, 5000}, RescaleMode::Area, 0.001),
              cv::Size(1, 1));
}

TEST(WatermarkSizeTest, RejectsBadProportion) {
    EXPECT_EQ(thrown_kind([] { compute_watermark_size({100, 100}, {10, 10}, RescaleMode::Linear, 0.0); }),
              ErrorKind::InvalidProportion);
    EXPECT_EQ(thrown_kind([] { compute_watermark_size({100, 100}, {10, 10}, RescaleMode::Area, 1.5); }),
              ErrorKind::InvalidProportion);
}

TEST(WatermarkSizeTest, RejectsUnknownMode) {
    EXPECT_EQ(thrown_kind([] {
                  compute_watermark_size({100, 100}, {10, 10}, static_cast<RescaleMode>(42), 0.5);
              }),
              ErrorKind::InvalidMode);
}

TEST(WatermarkSizeTest, SideBeyondIntRangeIsSizeMismatch) {
    // Linear scaling to the full width of a 60000 wide base: height would be 2.4e9
    EXPECT_EQ(thrown_kind([] {
                  compute_watermark_size({60000, 100}, {1, 40000}, RescaleMode::Linear, 1.0);
              }),
              ErrorKind::SizeMismatch);
}

TEST(WatermarkSizeTest, RejectsEmptySizes) {
    EXPECT_EQ(thrown_kind([] { compute_watermark_size({100, 100}, {0, 10}, RescaleMode::Linear, 0.5); }),
              ErrorKind::SizeMismatch);
    EXPECT_EQ(thrown_kind([] { compute_watermark_size({0, 0}, {10, 10}, RescaleMode::Linear, 0.5); }),
              ErrorKind::SizeMismatch);
}

// =============================================================================
// Single placement
// =============================================================================

TEST(SinglePlacementTest, MiddleCenters) {
    const Placement p = compute_placement({1000, 1000}, {100, 100}, single_at(Anchor::Middle));
    EXPECT_EQ(std::get<cv::Point>(p), cv::Point(450, 450));
}

TEST(SinglePlacementTest, MiddleFloors) {
    const Placement p = compute_placement({101, 100}, {10, 11}, single_at(Anchor::Middle));
    EXPECT_EQ(std::get<cv::Point>(p), cv::Point(45, 44));
}

TEST(SinglePlacementTest, CornersAreFlush) {
    const cv::Size base(640, 480);
    const cv::Size mark(64, 48);

    EXPECT_EQ(std::get<cv::Point>(compute_placement(base, mark, single_at(Anchor::UpperLeft))),
              cv::Point(0, 0));
    EXPECT_EQ(std::get<cv::Point>(compute_placement(base, mark, single_at(Anchor::UpperRight))),
              cv::Point(576, 0));
    EXPECT_EQ(std::get<cv::Point>(compute_placement(base, mark, single_at(Anchor::LowerLeft))),
              cv::Point(0, 432));
    EXPECT_EQ(std::get<cv::Point>(compute_placement(base, mark, single_at(Anchor::LowerRight))),
              cv::Point(576, 432));
}

TEST(SinglePlacementTest, MarginInsetsCorners) {
    const cv::Size base(640, 480);
    const cv::Size mark(64, 48);

    EXPECT_EQ(std::get<cv::Point>(compute_placement(base, mark, single_at(Anchor::UpperLeft, 20))),
              cv::Point(20, 20));
    EXPECT_EQ(std::get<cv::Point>(compute_placement(base, mark, single_at(Anchor::LowerRight, 20))),
              cv::Point(556, 412));
}

TEST(SinglePlacementTest, MarginTooLargeIsOutOfBounds) {
    EXPECT_EQ(thrown_kind([] {
                  compute_placement({100, 100}, {50, 50}, single_at(Anchor::UpperLeft, 60));
              }),
              ErrorKind::OutOfBounds);
    EXPECT_EQ(thrown_kind([] {
                  compute_placement({100, 100}, {50, 50}, single_at(Anchor::LowerRight, 51));
              }),
              ErrorKind::OutOfBounds);
}

TEST(SinglePlacementTest, ExplicitCoordinatesAreVerbatim) {
    const Placement p = compute_placement({640, 480}, {64, 48}, single_at(cv::Point(10, 20)));
    EXPECT_EQ(std::get<cv::Point>(p), cv::Point(10, 20));

    // Partially past the far edge is still placeable
    const Placement edge = compute_placement({640, 480}, {64, 48}, single_at(cv::Point(630, 470)));
    EXPECT_EQ(std::get<cv::Point>(edge), cv::Point(630, 470));
}

TEST(SinglePlacementTest, ExplicitCoordinatesOutsideAreOutOfBounds) {
    for (cv::Point point : {cv::Point(640, 0), cv::Point(0, 480), cv::Point(900, 900), cv::Point(-5, 0)}) {
        EXPECT_EQ(thrown_kind([&] { compute_placement({640, 480}, {64, 48}, single_at(point)); }),
                  ErrorKind::OutOfBounds)
            << point;
    }
}

TEST(SinglePlacementTest, OversizedWatermarkIsSizeMismatch) {
    EXPECT_EQ(thrown_kind([] { compute_placement({100, 100}, {120, 20}, single_at(Anchor::Middle)); }),
              ErrorKind::SizeMismatch);
    EXPECT_EQ(thrown_kind([] { compute_placement({100, 100}, {20, 101}, single_at(cv::Point(0, 0))); }),
              ErrorKind::SizeMismatch);
}

// =============================================================================
// Tile placement
// =============================================================================

TEST(TilePlacementTest, GridCoversBaseRowMajor) {
    const std::vector<cv::Point> expected{
        {0, 0}, {40, 0}, {80, 0},
        {0, 30}, {40, 30}, {80, 30},
    };
    EXPECT_EQ(offsets(compute_placement({100, 50}, {30, 20}, tiled(10))), expected);
}

TEST(TilePlacementTest, OffsetAtTrailingEdgeIsDropped) {
    // Step is 40x30; x = 80 would start exactly at the edge
    const std::vector<cv::Point> expected{{0, 0}, {40, 0}};
    EXPECT_EQ(offsets(compute_placement({80, 30}, {30, 20}, tiled(10))), expected);
}

TEST(TilePlacementTest, OffsetsAreMonotonicAndInBounds) {
    const cv::Size base(1920, 1080);
    const Placement p = compute_placement(base, {173, 59}, tiled(17));
    const std::vector<cv::Point> points = offsets(p);

    ASSERT_FALSE(points.empty());
    for (std::size_t i = 0; i < points.size(); ++i) {
        EXPECT_GE(points[i].x, 0);
        EXPECT_GE(points[i].y, 0);
        EXPECT_LT(points[i].x, base.width);
        EXPECT_LT(points[i].y, base.height);

        if (i > 0) {
            const bool next_in_row = points[i].y == points[i - 1].y && points[i].x > points[i - 1].x;
            const bool next_row = points[i].y > points[i - 1].y;
            EXPECT_TRUE(next_in_row || next_row) << points[i - 1] << " -> " << points[i];
        }
    }
}

TEST(TilePlacementTest, WatermarkLargerThanBaseGivesOneTile) {
    const std::vector<cv::Point> expected{{0, 0}};
    EXPECT_EQ(offsets(compute_placement({50, 50}, {80, 80}, tiled(5))), expected);
}

TEST(TilePlacementTest, HugePaddingStillPlacesFirstTile) {
    const int padding = std::numeric_limits<int>::max() - 50;
    const std::vector<cv::Point> expected{{0, 0}};
    EXPECT_EQ(offsets(compute_placement({1000, 1000}, {100, 100}, tiled(padding))), expected);
    EXPECT_EQ(offsets(compute_placement({1000, 1000}, {100, 100},
                                        tiled(padding, TileLayout::Checkerboard))),
              expected);
}

TEST(TilePlacementTest, ZeroPaddingAbutsTiles) {
    const std::vector<cv::Point> expected{{0, 0}, {25, 0}, {0, 25}, {25, 25}};
    EXPECT_EQ(offsets(compute_placement({50, 50}, {25, 25}, tiled(0))), expected);
}

TEST(TilePlacementTest, CheckerboardKeepsEvenCells) {
    const std::vector<cv::Point> expected{{0, 0}, {80, 0}, {40, 30}};
    EXPECT_EQ(offsets(compute_placement({100, 50}, {30, 20}, tiled(10, TileLayout::Checkerboard))),
              expected);
}

TEST(TilePlacementTest, SizeMatchesIteration) {
    for (TileLayout layout : {TileLayout::Grid, TileLayout::Checkerboard}) {
        for (cv::Size base : {cv::Size(100, 50), cv::Size(333, 777), cv::Size(1, 1), cv::Size(90, 90)}) {
            const TileGrid grid(base, {30, 20}, 10, layout);
            EXPECT_EQ(static_cast<std::size_t>(std::distance(grid.begin(), grid.end())), grid.size())
                << base << " " << to_string(layout);
        }
    }
}

TEST(TilePlacementTest, NegativePaddingIsRejected) {
    EXPECT_EQ(thrown_kind([] { compute_placement({100, 100}, {10, 10}, tiled(-1)); }),
              ErrorKind::InvalidPadding);
}

TEST(TilePlacementTest, UnknownModeIsRejected) {
    PlacementSpec spec;
    spec.mode = static_cast<WatermarkMode>(5);
    EXPECT_EQ(thrown_kind([&] { compute_placement({100, 100}, {10, 10}, spec); }),
              ErrorKind::InvalidMode);
}
