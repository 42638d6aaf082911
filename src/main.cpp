/**
 * @file    main.cpp
 * @brief   Watermarker - CLI Entry Point
 * @license MIT
 *
 * @details
 * A command-line tool to stamp a watermark image onto one image or every
 * image in a directory.
 *
 * Usage:
 *   watermarker photo.jpg logo.png
 *   watermarker photos/ logo.png -o out --mode TILE --opacity 0.3
 *   watermarker photos/ logo.png --position 40,40 --proportion 0.2
 *   watermarker photos/ logo.png --config watermark.ini
 */

#include "core/batch_processor.hpp"
#include "core/errors.hpp"
#include "core/watermark_options.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <map>
#include <string>

// =============================================================================
// Platform-specific includes
// =============================================================================
#ifdef _WIN32
    #include <windows.h>
#endif

namespace {

/**
 * Setup console for proper UTF-8 and ANSI color support
 */
void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);

    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
    }
#endif
}

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "  Watermarker");
    fmt::print(fmt::fg(fmt::color::gray), "  v{}\n\n", WMK_VERSION);
}

void print_summary(const wmk::BatchSummary& summary) {
    fmt::print(fmt::fg(fmt::color::green), "\n[OK] Completed: {} succeeded", summary.succeeded);
    if (summary.failed > 0) {
        fmt::print(fmt::fg(fmt::color::red), ", {} failed", summary.failed);
    }
    fmt::print(" ({} attempted)\n", summary.attempted);

    for (const auto& failure : summary.failures) {
        fmt::print(fmt::fg(fmt::color::red), "  [FAIL] {}: {}\n",
                   failure.path.filename(), failure.message);
    }
}

} // namespace

int main(int argc, char** argv) {
    setup_console();

    CLI::App app{"Watermarker - apply a watermark image to one image or a directory of images"};
    app.set_version_flag("-V,--version", WMK_VERSION);
    app.set_config("--config", "", "Read options from an INI or TOML file");

    wmk::BatchRequest request;
    wmk::WatermarkOptions& options = request.options;
    options.opacity = 0.5f;
    options.tile_padding = 50;

    std::string input_path;
    std::string watermark_path;
    std::string output_path = "output";
    std::string position = "LOWER_RIGHT";

    // Input/Output paths
    app.add_option("input", input_path, "Image file or directory of images")
        ->required()
        ->check(CLI::ExistingPath);

    app.add_option("watermark", watermark_path, "Watermark image")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("-o,--output", output_path, "Directory to save the watermarked images")
        ->capture_default_str();

    // Placement
    const std::map<std::string, wmk::WatermarkMode> mode_map{
        {"SINGLE", wmk::WatermarkMode::Single},
        {"TILE", wmk::WatermarkMode::Tile},
    };
    app.add_option("--mode", options.mode, "SINGLE or TILE")
        ->transform(CLI::CheckedTransformer(mode_map, CLI::ignore_case));

    app.add_option("--position", position,
        "SINGLE mode position: UPPER_LEFT, UPPER_RIGHT, LOWER_LEFT, LOWER_RIGHT, MIDDLE or x,y")
        ->capture_default_str()
        ->check(CLI::Validator(
            [](std::string& value) -> std::string {
                try {
                    wmk::parse_position(value);
                    return {};
                } catch (const wmk::WatermarkError& e) {
                    return e.what();
                }
            },
            "POSITION"));

    app.add_option("--margin", options.margin, "Distance from the edges for corner positions (pixels)")
        ->capture_default_str()
        ->check(CLI::NonNegativeNumber);

    const std::map<std::string, wmk::TileLayout> layout_map{
        {"GRID", wmk::TileLayout::Grid},
        {"CHECKERBOARD", wmk::TileLayout::Checkerboard},
    };
    app.add_option("--tile-padding", options.tile_padding, "Padding between tiles in TILE mode (pixels)")
        ->capture_default_str()
        ->check(CLI::NonNegativeNumber);
    app.add_option("--tile-layout", options.tile_layout, "GRID or CHECKERBOARD")
        ->transform(CLI::CheckedTransformer(layout_map, CLI::ignore_case));

    // Scale and opacity
    const std::map<std::string, wmk::RescaleMode> rescale_map{
        {"LINEAR", wmk::RescaleMode::Linear},
        {"AREA", wmk::RescaleMode::Area},
    };
    app.add_option("--proportion", options.proportion,
        "Watermark size relative to the image width (LINEAR) or area (AREA), in (0, 1]")
        ->capture_default_str()
        ->check(CLI::Range(0.0, 1.0));
    app.add_option("--rescale-mode", options.rescale, "LINEAR or AREA")
        ->transform(CLI::CheckedTransformer(rescale_map, CLI::ignore_case));
    app.add_option("--opacity", options.opacity, "Watermark opacity in [0, 1]")
        ->capture_default_str()
        ->check(CLI::Range(0.0, 1.0));

    // Output naming
    app.add_option("--suffix", request.suffix, "Text appended to each output file name");
    app.add_option("--format", request.format, "Output format extension (png, jpg, webp, ...)");

    // Verbosity
    bool verbose = false;
    bool quiet = false;

    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Configure logging
    auto logger = spdlog::stdout_color_mt("wmk");
    spdlog::set_default_logger(logger);

    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (!quiet) {
        print_banner();
    }

    try {
        request.input = input_path;
        request.watermark = watermark_path;
        request.output_dir = output_path;
        options.position = wmk::parse_position(position);

        const wmk::BatchSummary summary = wmk::run_batch(request);

        if (!quiet) {
            print_summary(summary);
        }
        return (summary.failed > 0) ? 1 : 0;

    } catch (const wmk::WatermarkError& e) {
        spdlog::error("Aborted [{}]: {}", wmk::to_string(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
