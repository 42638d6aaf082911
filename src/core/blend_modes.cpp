/**
 * @file    blend_modes.cpp
 * @brief   Watermarker - Alpha Blending Primitives
 * @license MIT
 */

#include "core/blend_modes.hpp"
#include "core/errors.hpp"

#include <opencv2/imgproc.hpp>
#include <fmt/format.h>

namespace wmk {

namespace {

// Blend src over dst in place, both CV_8UC4 and of the same size
void blend_over(cv::Mat& dst, const cv::Mat& src) {
    CV_Assert(dst.type() == CV_8UC4 && src.type() == CV_8UC4);
    CV_Assert(dst.size() == src.size());

    for (int y = 0; y < dst.rows; ++y) {
        cv::Vec4b* d = dst.ptr<cv::Vec4b>(y);
        const cv::Vec4b* s = src.ptr<cv::Vec4b>(y);

        for (int x = 0; x < dst.cols; ++x) {
            const uchar sa = s[x][3];
            if (sa == 0) {
                continue;
            }
            if (sa == 255) {
                d[x] = s[x];
                continue;
            }

            const float src_a = sa / 255.0f;
            const float dst_a = (d[x][3] / 255.0f) * (1.0f - src_a);
            const float out_a = src_a + dst_a;

            for (int c = 0; c < 3; ++c) {
                d[x][c] = cv::saturate_cast<uchar>((s[x][c] * src_a + d[x][c] * dst_a) / out_a);
            }
            d[x][3] = cv::saturate_cast<uchar>(out_a * 255.0f);
        }
    }
}

} // namespace

cv::Mat to_bgra(const cv::Mat& image) {
    if (image.empty()) {
        throw WatermarkError(ErrorKind::SizeMismatch, "Empty image provided");
    }

    cv::Mat eight_bit;
    switch (image.depth()) {
        case CV_8U:
            eight_bit = image;
            break;
        case CV_16U:
            image.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
        case CV_64F:
            image.convertTo(eight_bit, CV_8U, 255.0);
            break;
        default:
            image.convertTo(eight_bit, CV_8U);
            break;
    }

    cv::Mat bgra;
    switch (eight_bit.channels()) {
        case 1:
            cv::cvtColor(eight_bit, bgra, cv::COLOR_GRAY2BGRA);
            break;
        case 3:
            cv::cvtColor(eight_bit, bgra, cv::COLOR_BGR2BGRA);
            break;
        case 4:
            bgra = (eight_bit.data == image.data) ? eight_bit.clone() : eight_bit;
            break;
        default:
            throw WatermarkError(ErrorKind::DecodeError,
                fmt::format("Unsupported channel count: {}", eight_bit.channels()));
    }
    return bgra;
}

cv::Mat apply_opacity(const cv::Mat& image, float factor) {
    if (!(factor >= 0.0f && factor <= 1.0f)) {
        throw WatermarkError(ErrorKind::InvalidOpacity,
            fmt::format("Opacity must be between 0.0 and 1.0 (got {})", factor));
    }

    cv::Mat result = to_bgra(image);
    if (factor == 1.0f) {
        return result;
    }

    cv::Mat alpha;
    cv::extractChannel(result, alpha, 3);
    alpha.convertTo(alpha, CV_8U, factor);
    cv::insertChannel(alpha, result, 3);
    return result;
}

void paste(cv::Mat& canvas, const cv::Mat& watermark, cv::Point offset) {
    const cv::Rect target = cv::Rect(offset, watermark.size()) & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (target.empty()) {
        return;
    }

    // Part of the watermark that lands on the canvas
    const cv::Rect source(target.tl() - offset, target.size());

    cv::Mat dst = canvas(target);
    blend_over(dst, watermark(source));
}

cv::Mat alpha_composite(const cv::Mat& base, const cv::Mat& overlay) {
    if (base.size() != overlay.size()) {
        throw WatermarkError(ErrorKind::SizeMismatch,
            fmt::format("Cannot composite {}x{} over {}x{}",
                        overlay.cols, overlay.rows, base.cols, base.rows));
    }

    cv::Mat result = base.clone();
    blend_over(result, overlay);
    return result;
}

cv::Mat compose(const cv::Mat& base, const cv::Mat& watermark, const Placement& placement) {
    cv::Mat result = to_bgra(base);
    const cv::Mat mark = to_bgra(watermark);

    cv::Mat layer(result.size(), CV_8UC4, cv::Scalar::all(0));

    if (const auto* offset = std::get_if<cv::Point>(&placement)) {
        if (mark.cols > result.cols || mark.rows > result.rows) {
            throw WatermarkError(ErrorKind::SizeMismatch,
                fmt::format("Watermark {}x{} does not fit in {}x{} image",
                            mark.cols, mark.rows, result.cols, result.rows));
        }
        if (!cv::Rect(0, 0, result.cols, result.rows).contains(*offset)) {
            throw WatermarkError(ErrorKind::OutOfBounds,
                fmt::format("Position ({},{}) is outside the {}x{} image",
                            offset->x, offset->y, result.cols, result.rows));
        }
        paste(layer, mark, *offset);
    } else {
        for (const cv::Point& tile : std::get<TileGrid>(placement)) {
            paste(layer, mark, tile);
        }
    }

    return alpha_composite(result, layer);
}

} // namespace wmk
