/**
 * @file    watermark_options.cpp
 * @brief   Watermarker - Option Validation and Parsing
 * @license MIT
 */

#include "core/watermark_options.hpp"
#include "core/errors.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace wmk {

namespace {

std::string to_upper_trimmed(std::string_view text) {
    auto first = text.find_first_not_of(" \t");
    auto last = text.find_last_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }

    std::string out(text.substr(first, last - first + 1));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool parse_int(std::string_view text, int& value) {
    auto first = text.find_first_not_of(" \t");
    auto last = text.find_last_not_of(" \t");
    if (first == std::string_view::npos) {
        return false;
    }
    text = text.substr(first, last - first + 1);

    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

void WatermarkOptions::validate() const {
    // NaN fails both comparisons, so test the accepted range positively
    if (!(proportion > 0.0)) {
        throw WatermarkError(ErrorKind::InvalidProportion,
            fmt::format("Proportion must be greater than 0 (got {})", proportion));
    }
    if (proportion > 1.0) {
        throw WatermarkError(ErrorKind::InvalidProportion,
            fmt::format("Proportion must be less than or equal to 1 (got {})", proportion));
    }

    if (!(opacity >= 0.0f && opacity <= 1.0f)) {
        throw WatermarkError(ErrorKind::InvalidOpacity,
            fmt::format("Opacity must be between 0.0 and 1.0 (got {})", opacity));
    }

    if (mode != WatermarkMode::Single && mode != WatermarkMode::Tile) {
        throw WatermarkError(ErrorKind::InvalidMode,
            fmt::format("Unknown watermark mode ({})", static_cast<int>(mode)));
    }
    if (rescale != RescaleMode::Linear && rescale != RescaleMode::Area) {
        throw WatermarkError(ErrorKind::InvalidMode,
            fmt::format("Unknown rescale mode ({})", static_cast<int>(rescale)));
    }
    if (tile_layout != TileLayout::Grid && tile_layout != TileLayout::Checkerboard) {
        throw WatermarkError(ErrorKind::InvalidMode,
            fmt::format("Unknown tile layout ({})", static_cast<int>(tile_layout)));
    }

    if (margin < 0) {
        throw WatermarkError(ErrorKind::InvalidPadding,
            fmt::format("Margin must be a non-negative integer (got {})", margin));
    }
    if (tile_padding < 0) {
        throw WatermarkError(ErrorKind::InvalidPadding,
            fmt::format("Tile padding must be a non-negative integer (got {})", tile_padding));
    }

    // Negative coordinates are outside every image, no need to wait for one
    if (const auto* point = std::get_if<cv::Point>(&position)) {
        if (point->x < 0 || point->y < 0) {
            throw WatermarkError(ErrorKind::OutOfBounds,
                fmt::format("Position coordinates must be non-negative (got {},{})",
                            point->x, point->y));
        }
    }
}

Position parse_position(std::string_view text) {
    const std::string name = to_upper_trimmed(text);

    if (name == "UPPER_LEFT")  return Anchor::UpperLeft;
    if (name == "UPPER_RIGHT") return Anchor::UpperRight;
    if (name == "LOWER_LEFT")  return Anchor::LowerLeft;
    if (name == "LOWER_RIGHT") return Anchor::LowerRight;
    if (name == "MIDDLE")      return Anchor::Middle;

    auto comma = text.find(',');
    if (comma != std::string_view::npos) {
        int x = 0;
        int y = 0;
        if (parse_int(text.substr(0, comma), x) && parse_int(text.substr(comma + 1), y)) {
            return cv::Point(x, y);
        }
    }

    throw WatermarkError(ErrorKind::InvalidPosition,
        fmt::format("Position must be UPPER_LEFT, UPPER_RIGHT, LOWER_LEFT, "
                    "LOWER_RIGHT, MIDDLE or x,y (got '{}')", text));
}

std::string_view to_string(WatermarkMode mode) noexcept {
    switch (mode) {
        case WatermarkMode::Single: return "SINGLE";
        case WatermarkMode::Tile:   return "TILE";
    }
    return "UNKNOWN";
}

std::string_view to_string(RescaleMode mode) noexcept {
    switch (mode) {
        case RescaleMode::Linear: return "LINEAR";
        case RescaleMode::Area:   return "AREA";
    }
    return "UNKNOWN";
}

std::string_view to_string(Anchor anchor) noexcept {
    switch (anchor) {
        case Anchor::UpperLeft:  return "UPPER_LEFT";
        case Anchor::UpperRight: return "UPPER_RIGHT";
        case Anchor::LowerLeft:  return "LOWER_LEFT";
        case Anchor::LowerRight: return "LOWER_RIGHT";
        case Anchor::Middle:     return "MIDDLE";
    }
    return "UNKNOWN";
}

std::string_view to_string(TileLayout layout) noexcept {
    switch (layout) {
        case TileLayout::Grid:         return "GRID";
        case TileLayout::Checkerboard: return "CHECKERBOARD";
    }
    return "UNKNOWN";
}

std::string to_string(const Position& position) {
    if (const auto* anchor = std::get_if<Anchor>(&position)) {
        return std::string(to_string(*anchor));
    }
    const auto& point = std::get<cv::Point>(position);
    return fmt::format("{},{}", point.x, point.y);
}

} // namespace wmk
