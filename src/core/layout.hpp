/**
 * @file    layout.hpp
 * @brief   Watermarker - Watermark Size and Placement Geometry
 * @license MIT
 *
 * @details
 * Pure geometry: no pixels are touched here.
 *
 *   compute_watermark_size  base + watermark size -> scaled watermark size
 *   compute_placement       base + scaled size    -> one offset or a tile grid
 */

#pragma once

#include "core/watermark_options.hpp"

#include <opencv2/core.hpp>
#include <cstddef>
#include <iterator>
#include <variant>

namespace wmk {

/**
 * Lazily enumerated tile offsets covering a base image
 *
 * Offsets start at (0, 0) and advance by (tile + padding) in both axes,
 * row-major, until the next offset would start at or beyond the base
 * image's trailing edge. Tiles running past the far edge are kept; the
 * compositor clips them.
 */
class TileGrid {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = cv::Point;
        using difference_type = std::ptrdiff_t;
        using pointer = const cv::Point*;
        using reference = const cv::Point&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const {
            return grid_ == other.grid_ && row_ == other.row_ && col_ == other.col_;
        }

    private:
        friend class TileGrid;

        iterator(const TileGrid* grid, int row, int col);

        // Move forward until the current cell belongs to the layout
        void settle();

        const TileGrid* grid_ = nullptr;
        int row_ = 0;
        int col_ = 0;
        cv::Point current_;
    };

    TileGrid(cv::Size base, cv::Size tile, int padding, TileLayout layout = TileLayout::Grid);

    iterator begin() const { return iterator(this, 0, 0); }
    iterator end() const { return iterator(this, rows_, 0); }

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    cv::Size tile_size() const { return tile_; }
    cv::Size step() const { return step_; }
    TileLayout layout() const { return layout_; }

    // Number of offsets the iteration yields
    std::size_t size() const;

    bool contains_cell(int row, int col) const;

private:
    cv::Size tile_;
    cv::Size step_;
    int rows_ = 0;
    int cols_ = 0;
    TileLayout layout_ = TileLayout::Grid;
};

/**
 * SINGLE mode yields one offset, TILE mode a grid of them
 */
using Placement = std::variant<cv::Point, TileGrid>;

/**
 * The subset of WatermarkOptions that drives placement
 */
struct PlacementSpec {
    WatermarkMode mode = WatermarkMode::Single;
    Position position = Anchor::LowerRight;
    int margin = 0;
    int tile_padding = 10;
    TileLayout tile_layout = TileLayout::Grid;
};

PlacementSpec placement_spec(const WatermarkOptions& options);

/**
 * Compute the rescaled watermark size
 *
 * LINEAR: width follows base width * proportion.
 * AREA:   area follows base area * proportion.
 * Aspect ratio is kept and the result is never smaller than 1x1.
 *
 * @throws WatermarkError  InvalidProportion, InvalidMode, SizeMismatch (empty input)
 */
cv::Size compute_watermark_size(
    cv::Size base,
    cv::Size watermark,
    RescaleMode mode,
    double proportion
);

/**
 * Compute where the (already rescaled) watermark goes
 *
 * @param base       Base image size
 * @param watermark  Rescaled watermark size
 * @param spec       Mode, position, margin and tiling parameters
 * @return           cv::Point for SINGLE mode, TileGrid for TILE mode
 *
 * @throws WatermarkError  OutOfBounds, SizeMismatch, InvalidPadding, InvalidMode
 */
Placement compute_placement(
    cv::Size base,
    cv::Size watermark,
    const PlacementSpec& spec
);

} // namespace wmk
