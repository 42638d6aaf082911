/**
 * @file    watermark_engine.hpp
 * @brief   Watermarker - Watermark Engine
 * @license MIT
 *
 * @details
 * The engine owns the decoded watermark and the validated options, and
 * runs the per-image pipeline:
 *
 *   rescale -> opacity -> place -> composite
 *
 * It holds no per-image state, so one engine serves a whole batch.
 */

#pragma once

#include "core/errors.hpp"
#include "core/watermark_options.hpp"

#include <opencv2/core.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace wmk {

class WatermarkEngine {
public:
    /**
     * Load the watermark from a file
     *
     * Options are validated before the file is touched.
     *
     * @param watermark_path  Watermark image (alpha channel is kept)
     * @param options         Batch-wide parameters
     *
     * @throws WatermarkError  Any validation kind, PathNotFound, DecodeError
     */
    WatermarkEngine(
        const std::filesystem::path& watermark_path,
        const WatermarkOptions& options
    );

    /**
     * Use an already decoded watermark
     *
     * @throws WatermarkError  Any validation kind, SizeMismatch on empty image
     */
    WatermarkEngine(
        const cv::Mat& watermark,
        const WatermarkOptions& options
    );

    /**
     * Watermark one image
     *
     * @param image  Base image (not modified)
     * @return       BGRA result, same size as image
     *
     * @throws WatermarkError  SizeMismatch, OutOfBounds
     */
    cv::Mat apply(const cv::Mat& image) const;

    /**
     * Rescaled, opacity-adjusted watermark for a base image of this size
     */
    cv::Mat prepare_watermark(cv::Size base_size) const;

    const cv::Mat& watermark() const { return watermark_; }
    const WatermarkOptions& options() const { return options_; }

private:
    cv::Mat watermark_;         // CV_8UC4, original resolution
    WatermarkOptions options_;
};

/**
 * Outcome of one file
 */
struct ProcessResult {
    bool success = false;
    std::optional<ErrorKind> error;  // set on failure when the cause is known
    std::string message;             // failure reason, empty on success
};

/**
 * Decode an image keeping its alpha channel
 *
 * @throws WatermarkError  PathNotFound, DecodeError
 */
cv::Mat read_image(const std::filesystem::path& path);

/**
 * Encode an image, format chosen by extension
 *
 * Alpha is dropped for formats without transparency (JPEG, BMP, PNM).
 * Parent directories are created as needed.
 *
 * @throws WatermarkError(EncodeError)  unsupported extension or write failure
 */
void write_image(const std::filesystem::path& path, const cv::Mat& image);

/**
 * Decode, watermark and encode a single file
 *
 * Never throws: failures are logged and returned. Nothing is written
 * unless the composite succeeded.
 *
 * @param input_path   Input image path
 * @param output_path  Output image path
 * @param engine       The watermark engine to use
 * @return             Processing result
 */
ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    const WatermarkEngine& engine
);

} // namespace wmk
