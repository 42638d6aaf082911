/**
 * @file    watermark_engine.cpp
 * @brief   Watermarker - Watermark Engine
 * @license MIT
 *
 * @details
 * Watermark Engine Implementation
 */

#include "core/watermark_engine.hpp"
#include "core/blend_modes.hpp"
#include "core/layout.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <system_error>
#include <vector>

namespace wmk {

WatermarkEngine::WatermarkEngine(
    const std::filesystem::path& watermark_path,
    const WatermarkOptions& options)
    : options_(options) {

    // Batch-wide parameters fail before any file I/O
    options_.validate();

    watermark_ = to_bgra(read_image(watermark_path));
    spdlog::info("Loaded watermark: {} ({}x{})",
                 watermark_path.filename(), watermark_.cols, watermark_.rows);
}

WatermarkEngine::WatermarkEngine(
    const cv::Mat& watermark,
    const WatermarkOptions& options)
    : options_(options) {

    options_.validate();
    watermark_ = to_bgra(watermark);
}

cv::Mat WatermarkEngine::prepare_watermark(cv::Size base_size) const {
    const cv::Size target = compute_watermark_size(
        base_size, watermark_.size(), options_.rescale, options_.proportion);

    // A single watermark that cannot fit is rejected before resampling it
    if (options_.mode == WatermarkMode::Single &&
        (target.width > base_size.width || target.height > base_size.height)) {
        throw WatermarkError(ErrorKind::SizeMismatch,
            fmt::format("Watermark {}x{} does not fit in {}x{} image",
                        target.width, target.height, base_size.width, base_size.height));
    }

    cv::Mat resized = watermark_;
    if (target != watermark_.size()) {
        // Lanczos when enlarging, area averaging when shrinking
        const int interp_method = (target.width > watermark_.cols || target.height > watermark_.rows)
                                  ? cv::INTER_LANCZOS4
                                  : cv::INTER_AREA;
        cv::resize(watermark_, resized, target, 0, 0, interp_method);

        spdlog::debug("Watermark resized {}x{} -> {}x{} ({}, proportion {})",
                      watermark_.cols, watermark_.rows, target.width, target.height,
                      to_string(options_.rescale), options_.proportion);
    }

    return apply_opacity(resized, options_.opacity);
}

cv::Mat WatermarkEngine::apply(const cv::Mat& image) const {
    if (image.empty()) {
        throw WatermarkError(ErrorKind::SizeMismatch, "Empty image provided");
    }

    const cv::Mat mark = prepare_watermark(image.size());
    const Placement placement = compute_placement(image.size(), mark.size(), placement_spec(options_));

    if (const auto* offset = std::get_if<cv::Point>(&placement)) {
        spdlog::debug("Placing {}x{} watermark at ({}, {}) [{}]",
                      mark.cols, mark.rows, offset->x, offset->y, to_string(options_.position));
    } else {
        const auto& grid = std::get<TileGrid>(placement);
        spdlog::debug("Tiling {}x{} watermark: {} tiles on a {}x{} grid ({}, padding {})",
                      mark.cols, mark.rows, grid.size(), grid.cols(), grid.rows(),
                      to_string(grid.layout()), options_.tile_padding);
    }

    return compose(image, mark, placement);
}

cv::Mat read_image(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw WatermarkError(ErrorKind::PathNotFound,
            fmt::format("File not found: {}", path));
    }

    cv::Mat image;
    try {
        image = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw WatermarkError(ErrorKind::DecodeError,
            fmt::format("Failed to decode {}: {}", path, e.what()));
    }

    if (image.empty()) {
        throw WatermarkError(ErrorKind::DecodeError,
            fmt::format("Failed to load image: {}", path));
    }
    return image;
}

void write_image(const std::filesystem::path& path, const cv::Mat& image) {
    const std::string ext = lowercase_extension(path);

    if (ext.empty() || !cv::haveImageWriter(path.string())) {
        throw WatermarkError(ErrorKind::EncodeError,
            fmt::format("Unsupported output format: {}", path));
    }

    // Determine output format and quality
    cv::Mat encoded = image;
    std::vector<int> params;

    if (ext == ".jpg" || ext == ".jpeg" || ext == ".jpe") {
        params = {cv::IMWRITE_JPEG_QUALITY, 95};
    } else if (ext == ".png") {
        // PNG: lossless, compression level only affects file size/speed
        params = {cv::IMWRITE_PNG_COMPRESSION, 6};
    } else if (ext == ".webp") {
        // WebP: 101+ = lossless mode
        params = {cv::IMWRITE_WEBP_QUALITY, 101};
    }

    if (encoded.channels() == 4 && !supports_alpha(path)) {
        cv::cvtColor(image, encoded, cv::COLOR_BGRA2BGR);
    }

    // Create output directory if needed
    auto output_dir = path.parent_path();
    if (!output_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(output_dir, ec);
        if (ec) {
            throw WatermarkError(ErrorKind::EncodeError,
                fmt::format("Cannot create directory {}: {}", output_dir, ec.message()));
        }
    }

    bool success = false;
    try {
        success = cv::imwrite(path.string(), encoded, params);
    } catch (const cv::Exception& e) {
        throw WatermarkError(ErrorKind::EncodeError,
            fmt::format("Failed to write image {}: {}", path, e.what()));
    }

    if (!success) {
        throw WatermarkError(ErrorKind::EncodeError,
            fmt::format("Failed to write image: {}", path));
    }
}

ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    const WatermarkEngine& engine) {
    try {
        cv::Mat image = read_image(input_path);

        spdlog::info("Processing: {} ({}x{})",
                     input_path.filename(),
                     image.cols, image.rows);

        cv::Mat result = engine.apply(image);
        image.release();

        write_image(output_path, result);

        spdlog::info("Saved: {}", output_path.filename());
        return ProcessResult{.success = true};

    } catch (const WatermarkError& e) {
        spdlog::error("Error processing {}: [{}] {}", input_path, to_string(e.kind()), e.what());
        return ProcessResult{.success = false, .error = e.kind(), .message = e.what()};
    } catch (const std::exception& e) {
        spdlog::error("Error processing {}: {}", input_path, e.what());
        return ProcessResult{.success = false, .message = e.what()};
    }
}

} // namespace wmk
