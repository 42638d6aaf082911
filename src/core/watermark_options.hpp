/**
 * @file    watermark_options.hpp
 * @brief   Watermarker - Placement and Scaling Options
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace wmk {

/**
 * How many copies of the watermark go onto the image
 */
enum class WatermarkMode {
    Single,
    Tile,
};

/**
 * How the watermark is scaled relative to the base image
 */
enum class RescaleMode {
    Linear,  // watermark width = proportion * base width
    Area,    // watermark area  = proportion * base area
};

/**
 * Named positions for SINGLE mode
 */
enum class Anchor {
    UpperLeft,
    UpperRight,
    LowerLeft,
    LowerRight,
    Middle,
};

/**
 * Which cells of the tile grid receive a watermark
 */
enum class TileLayout {
    Grid,          // every cell
    Checkerboard,  // cells with even (row + col) only
};

/**
 * Either a named anchor or explicit top-left coordinates
 */
using Position = std::variant<Anchor, cv::Point>;

/**
 * Batch-wide watermarking parameters
 */
struct WatermarkOptions {
    WatermarkMode mode = WatermarkMode::Single;
    float opacity = 1.0f;            // [0.0, 1.0]
    double proportion = 0.1;         // (0.0, 1.0]
    RescaleMode rescale = RescaleMode::Linear;
    Position position = Anchor::LowerRight;
    int margin = 0;                  // corner inset in pixels, SINGLE mode
    int tile_padding = 10;           // gap between tiles in pixels, TILE mode
    TileLayout tile_layout = TileLayout::Grid;

    /**
     * Check every parameter that does not depend on image dimensions.
     * Throws WatermarkError naming the first violated constraint.
     */
    void validate() const;
};

/**
 * Parse a position string
 *
 * Accepts UPPER_LEFT, UPPER_RIGHT, LOWER_LEFT, LOWER_RIGHT, MIDDLE
 * (case-insensitive) or "x,y" with non-negative integers.
 *
 * @throws WatermarkError(InvalidPosition)
 */
Position parse_position(std::string_view text);

std::string_view to_string(WatermarkMode mode) noexcept;
std::string_view to_string(RescaleMode mode) noexcept;
std::string_view to_string(Anchor anchor) noexcept;
std::string_view to_string(TileLayout layout) noexcept;
std::string to_string(const Position& position);

} // namespace wmk
