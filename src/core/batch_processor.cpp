/**
 * @file    batch_processor.cpp
 * @brief   Watermarker - Batch Processing
 * @license MIT
 */

#include "core/batch_processor.hpp"
#include "core/watermark_engine.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace wmk {

namespace {

std::string normalized_extension(const std::string& format) {
    std::string ext = format;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

} // namespace

std::vector<fs::path> collect_inputs(const fs::path& input) {
    std::error_code ec;
    std::vector<fs::path> files;

    if (fs::is_directory(input, ec)) {
        spdlog::info("Batch processing directory: {}", input);

        for (const auto& entry : fs::directory_iterator(input)) {
            if (!entry.is_regular_file()) continue;
            if (!is_supported_image(entry.path())) continue;
            files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    if (fs::is_regular_file(input, ec)) {
        if (!is_supported_image(input)) {
            throw WatermarkError(ErrorKind::DecodeError,
                fmt::format("Input file is not a recognized image: {}", input));
        }
        files.push_back(input);
        return files;
    }

    throw WatermarkError(ErrorKind::PathNotFound,
        fmt::format("The input path '{}' does not exist", input));
}

fs::path output_path_for(const fs::path& input, const BatchRequest& request) {
    std::string ext = request.format.empty()
                      ? to_utf8(input.extension())
                      : normalized_extension(request.format);

    fs::path name = input.stem();
    name += request.suffix;
    name += ext;
    return request.output_dir / name;
}

BatchSummary run_batch(const BatchRequest& request) {
    // Batch-wide checks come first: they would fail identically for every file
    request.options.validate();

    std::error_code ec;
    if (!fs::is_regular_file(request.watermark, ec)) {
        throw WatermarkError(ErrorKind::PathNotFound,
            fmt::format("Watermark's path not found in '{}'", request.watermark));
    }

    const std::vector<fs::path> inputs = collect_inputs(request.input);
    const WatermarkEngine engine(request.watermark, request.options);

    fs::create_directories(request.output_dir, ec);
    if (ec) {
        throw WatermarkError(ErrorKind::EncodeError,
            fmt::format("Cannot create output directory '{}': {}", request.output_dir, ec.message()));
    }
    spdlog::info("Output directory: {}", request.output_dir);

    spdlog::debug("Mode {} | opacity {} | proportion {} ({}) | position {} | margin {} | "
                  "tile padding {} ({})",
                  to_string(request.options.mode), request.options.opacity,
                  request.options.proportion, to_string(request.options.rescale),
                  to_string(request.options.position), request.options.margin,
                  request.options.tile_padding, to_string(request.options.tile_layout));

    BatchSummary summary;
    if (inputs.empty()) {
        spdlog::warn("No valid image found in {}", request.input);
        return summary;
    }

    for (const fs::path& input : inputs) {
        ++summary.attempted;

        const fs::path output = output_path_for(input, request);

        // Never write over a source image
        std::error_code same_ec;
        if (fs::equivalent(input, output, same_ec)) {
            const std::string message =
                fmt::format("Output would overwrite the input image: {}", output);
            spdlog::error("[{}] {}", to_string(ErrorKind::EncodeError), message);
            ++summary.failed;
            summary.failures.push_back(FileFailure{
                .path = input,
                .error = ErrorKind::EncodeError,
                .message = message
            });
            continue;
        }

        const ProcessResult result = process_image(input, output, engine);
        if (result.success) {
            ++summary.succeeded;
        } else {
            ++summary.failed;
            summary.failures.push_back(FileFailure{
                .path = input,
                .error = result.error,
                .message = result.message
            });
        }
    }

    spdlog::info("Batch finished: {} attempted, {} succeeded, {} failed",
                 summary.attempted, summary.succeeded, summary.failed);
    return summary;
}

} // namespace wmk
