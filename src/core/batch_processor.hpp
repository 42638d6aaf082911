/**
 * @file    batch_processor.hpp
 * @brief   Watermarker - Batch Processing
 * @license MIT
 *
 * @details
 * Resolves the input (one file or a directory of images), runs the engine
 * on each file and collects the outcome. Batch-wide problems (bad options,
 * missing input or watermark) abort by throwing before any image is
 * processed; per-file failures are recorded and the batch goes on.
 */

#pragma once

#include "core/errors.hpp"
#include "core/watermark_options.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wmk {

struct BatchRequest {
    std::filesystem::path input;              // image file or directory
    std::filesystem::path watermark;          // watermark image
    std::filesystem::path output_dir = "output";
    WatermarkOptions options;
    std::string suffix;                       // appended to each output stem
    std::string format;                       // output extension ("png", ".jpg"); empty keeps the input's
};

struct FileFailure {
    std::filesystem::path path;
    std::optional<ErrorKind> error;
    std::string message;
};

struct BatchSummary {
    std::size_t attempted = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::vector<FileFailure> failures;
};

/**
 * List the images to process
 *
 * A directory is scanned non-recursively; entries without a recognized
 * image extension are skipped. Results are sorted.
 *
 * @throws WatermarkError  PathNotFound, DecodeError (single file that is not an image)
 */
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path& input);

/**
 * Output location for one input: <output_dir>/<stem><suffix><ext>
 */
std::filesystem::path output_path_for(
    const std::filesystem::path& input,
    const BatchRequest& request
);

/**
 * Watermark every input image
 *
 * @throws WatermarkError  batch-wide failures only
 */
BatchSummary run_batch(const BatchRequest& request);

} // namespace wmk
