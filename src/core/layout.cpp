/**
 * @file    layout.cpp
 * @brief   Watermarker - Watermark Size and Placement Geometry
 * @license MIT
 */

#include "core/layout.hpp"
#include "core/errors.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace wmk {

// =============================================================================
// TileGrid
// =============================================================================

TileGrid::TileGrid(cv::Size base, cv::Size tile, int padding, TileLayout layout)
    : tile_(tile), layout_(layout) {
    if (base.width <= 0 || base.height <= 0) {
        throw WatermarkError(ErrorKind::SizeMismatch,
            fmt::format("Base image dimensions cannot be zero ({}x{})", base.width, base.height));
    }
    if (tile.width <= 0 || tile.height <= 0) {
        throw WatermarkError(ErrorKind::SizeMismatch,
            fmt::format("Tile dimensions cannot be zero ({}x{})", tile.width, tile.height));
    }
    if (padding < 0) {
        throw WatermarkError(ErrorKind::InvalidPadding,
            fmt::format("Tile padding must be a non-negative integer (got {})", padding));
    }
    if (layout != TileLayout::Grid && layout != TileLayout::Checkerboard) {
        throw WatermarkError(ErrorKind::InvalidMode,
            fmt::format("Unknown tile layout ({})", static_cast<int>(layout)));
    }

    // A step past the base extent leaves a single row or column, so clamp it there
    const auto clamp_step = [](int extent, int tile_side, int pad) {
        return static_cast<int>(std::min<std::int64_t>(std::int64_t{tile_side} + pad, extent));
    };
    step_ = cv::Size(clamp_step(base.width, tile.width, padding),
                     clamp_step(base.height, tile.height, padding));

    // Offsets c * step < extent, for c = 0 .. ceil(extent / step) - 1
    cols_ = static_cast<int>((std::int64_t{base.width} + step_.width - 1) / step_.width);
    rows_ = static_cast<int>((std::int64_t{base.height} + step_.height - 1) / step_.height);
}

bool TileGrid::contains_cell(int row, int col) const {
    if (row < 0 || row >= rows_ || col < 0 || col >= cols_) {
        return false;
    }
    return layout_ == TileLayout::Grid || (row + col) % 2 == 0;
}

std::size_t TileGrid::size() const {
    const auto rows = static_cast<std::size_t>(rows_);
    const auto cols = static_cast<std::size_t>(cols_);
    if (layout_ == TileLayout::Grid) {
        return rows * cols;
    }
    // Even rows keep ceil(cols / 2) cells, odd rows floor(cols / 2)
    return ((rows + 1) / 2) * ((cols + 1) / 2) + (rows / 2) * (cols / 2);
}

TileGrid::iterator::iterator(const TileGrid* grid, int row, int col)
    : grid_(grid), row_(row), col_(col) {
    settle();
}

void TileGrid::iterator::settle() {
    while (row_ < grid_->rows_ && !grid_->contains_cell(row_, col_)) {
        if (++col_ >= grid_->cols_) {
            col_ = 0;
            ++row_;
        }
    }
    if (row_ >= grid_->rows_) {
        row_ = grid_->rows_;
        col_ = 0;
    }
    current_ = cv::Point(col_ * grid_->step_.width, row_ * grid_->step_.height);
}

TileGrid::iterator& TileGrid::iterator::operator++() {
    if (++col_ >= grid_->cols_) {
        col_ = 0;
        ++row_;
    }
    settle();
    return *this;
}

TileGrid::iterator TileGrid::iterator::operator++(int) {
    iterator previous = *this;
    ++(*this);
    return previous;
}

// =============================================================================
// Size
// =============================================================================

PlacementSpec placement_spec(const WatermarkOptions& options) {
    return PlacementSpec{
        .mode = options.mode,
        .position = options.position,
        .margin = options.margin,
        .tile_padding = options.tile_padding,
        .tile_layout = options.tile_layout
    };
}

cv::Size compute_watermark_size(
    cv::Size base,
    cv::Size watermark,
    RescaleMode mode,
    double proportion)
{
    if (!(proportion > 0.0) || proportion > 1.0) {
        throw WatermarkError(ErrorKind::InvalidProportion,
            fmt::format("Proportion must be in (0, 1] (got {})", proportion));
    }
    if (mode != RescaleMode::Linear && mode != RescaleMode::Area) {
        throw WatermarkError(ErrorKind::InvalidMode,
            fmt::format("Unknown rescale mode ({})", static_cast<int>(mode)));
    }
    if (base.width <= 0 || base.height <= 0) {
        throw WatermarkError(ErrorKind::SizeMismatch,
            fmt::format("Base image dimensions cannot be zero ({}x{})", base.width, base.height));
    }
    if (watermark.width <= 0 || watermark.height <= 0) {
        throw WatermarkError(ErrorKind::SizeMismatch,
            fmt::format("Watermark image dimensions cannot be zero ({}x{})",
                        watermark.width, watermark.height));
    }

    double scale = 1.0;
    if (mode == RescaleMode::Linear) {
        scale = static_cast<double>(base.width) * proportion / watermark.width;
    } else {
        // Same scale on both axes keeps the aspect ratio, sqrt makes the area match
        const double base_area = static_cast<double>(base.width) * base.height;
        const double watermark_area = static_cast<double>(watermark.width) * watermark.height;
        scale = std::sqrt(base_area * proportion / watermark_area);
    }

    const double width = std::round(watermark.width * scale);
    const double height = std::round(watermark.height * scale);
    constexpr double max_side = std::numeric_limits<int>::max();
    if (width > max_side || height > max_side) {
        throw WatermarkError(ErrorKind::SizeMismatch,
            fmt::format("Rescaled watermark {:.0f}x{:.0f} exceeds the largest supported image",
                        width, height));
    }
    return cv::Size(std::max(1, static_cast<int>(width)), std::max(1, static_cast<int>(height)));
}

// =============================================================================
// Placement
// =============================================================================

namespace {

cv::Point anchor_offset(cv::Size base, cv::Size watermark, Anchor anchor, int margin) {
    const int right = base.width - watermark.width - margin;
    const int bottom = base.height - watermark.height - margin;

    switch (anchor) {
        case Anchor::UpperLeft:  return cv::Point(margin, margin);
        case Anchor::UpperRight: return cv::Point(right, margin);
        case Anchor::LowerLeft:  return cv::Point(margin, bottom);
        case Anchor::LowerRight: return cv::Point(right, bottom);
        case Anchor::Middle:
            return cv::Point((base.width - watermark.width) / 2,
                             (base.height - watermark.height) / 2);
    }
    throw WatermarkError(ErrorKind::InvalidPosition,
        fmt::format("Unknown anchor ({})", static_cast<int>(anchor)));
}

cv::Point single_offset(cv::Size base, cv::Size watermark, const PlacementSpec& spec) {
    if (spec.margin < 0) {
        throw WatermarkError(ErrorKind::InvalidPadding,
            fmt::format("Margin must be a non-negative integer (got {})", spec.margin));
    }
    if (watermark.width > base.width || watermark.height > base.height) {
        throw WatermarkError(ErrorKind::SizeMismatch,
            fmt::format("Watermark {}x{} does not fit in {}x{} image",
                        watermark.width, watermark.height, base.width, base.height));
    }

    if (const auto* point = std::get_if<cv::Point>(&spec.position)) {
        const cv::Rect bounds(0, 0, base.width, base.height);
        if (!bounds.contains(*point)) {
            throw WatermarkError(ErrorKind::OutOfBounds,
                fmt::format("Position ({},{}) is outside the {}x{} image",
                            point->x, point->y, base.width, base.height));
        }
        return *point;
    }

    const Anchor anchor = std::get<Anchor>(spec.position);
    const cv::Point offset = anchor_offset(base, watermark, anchor, spec.margin);
    const cv::Rect bounds(0, 0, base.width, base.height);
    const cv::Rect footprint(offset, watermark);
    if ((footprint & bounds) != footprint) {
        throw WatermarkError(ErrorKind::OutOfBounds,
            fmt::format("Margin {} pushes the {}x{} watermark outside the {}x{} image at {}",
                        spec.margin, watermark.width, watermark.height,
                        base.width, base.height, to_string(anchor)));
    }
    return offset;
}

} // namespace

Placement compute_placement(
    cv::Size base,
    cv::Size watermark,
    const PlacementSpec& spec)
{
    if (base.width <= 0 || base.height <= 0 || watermark.width <= 0 || watermark.height <= 0) {
        throw WatermarkError(ErrorKind::SizeMismatch,
            fmt::format("Cannot place a {}x{} watermark on a {}x{} image",
                        watermark.width, watermark.height, base.width, base.height));
    }

    switch (spec.mode) {
        case WatermarkMode::Single:
            return single_offset(base, watermark, spec);
        case WatermarkMode::Tile:
            return TileGrid(base, watermark, spec.tile_padding, spec.tile_layout);
    }
    throw WatermarkError(ErrorKind::InvalidMode,
        fmt::format("Unknown watermark mode ({})", static_cast<int>(spec.mode)));
}

} // namespace wmk
