/**
 * @file    path_formatter.hpp
 * @brief   fmt formatter for std::filesystem::path and image path helpers
 * @license MIT
 *
 * @details
 * spdlog/fmt expect UTF-8, while path.string() is in the local codepage on
 * some platforms. path.u8string() is always UTF-8; in C++20 it returns
 * std::u8string (char8_t), hence the reinterpret_cast.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Processing: {}", some_path);
 */

#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace wmk {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Extension including the dot, lower-cased ("" when there is none)
 */
inline std::string lowercase_extension(const std::filesystem::path& path) {
    std::string ext = to_utf8(path.extension());
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// Extensions picked up when scanning a directory
inline constexpr std::array<std::string_view, 7> kImageExtensions = {
    ".png", ".jpg", ".jpeg", ".bmp", ".webp", ".tif", ".tiff"
};

inline bool is_supported_image(const std::filesystem::path& path) {
    const std::string ext = lowercase_extension(path);
    return std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) != kImageExtensions.end();
}

/**
 * Whether the format chosen by the extension keeps an alpha channel
 */
inline bool supports_alpha(const std::filesystem::path& path) {
    const std::string ext = lowercase_extension(path);
    return ext != ".jpg" && ext != ".jpeg" && ext != ".jpe" &&
           ext != ".bmp" && ext != ".ppm" && ext != ".pnm";
}

} // namespace wmk

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
