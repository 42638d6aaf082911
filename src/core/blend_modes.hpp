/**
 * @file    blend_modes.hpp
 * @brief   Watermarker - Alpha Blending Primitives
 * @license MIT
 *
 * @details
 * All blending works on straight (non-premultiplied) 8-bit BGRA images and
 * uses the Porter-Duff "over" operator:
 *
 *   out_a = src_a + dst_a * (1 - src_a)
 *   out_c = (src_c * src_a + dst_c * dst_a * (1 - src_a)) / out_a
 *
 * Fully opaque source pixels replace the destination, fully transparent
 * ones leave it untouched.
 */

#pragma once

#include "core/layout.hpp"

#include <opencv2/core.hpp>

namespace wmk {

/**
 * Convert any 1/3/4-channel image to 8-bit BGRA
 *
 * Images without alpha get a fully opaque alpha channel.
 * 16-bit images are scaled down, float images are assumed to be in [0, 1].
 * Always returns a new buffer.
 *
 * @throws WatermarkError(SizeMismatch) on an empty image
 * @throws WatermarkError(DecodeError) on an unsupported channel count
 */
cv::Mat to_bgra(const cv::Mat& image);

/**
 * Scale the alpha channel by factor, colour channels untouched
 *
 * @param image   Input image (not modified)
 * @param factor  Opacity in [0.0, 1.0]
 * @return        BGRA copy with alpha = round(alpha * factor)
 *
 * @throws WatermarkError(InvalidOpacity)
 */
cv::Mat apply_opacity(const cv::Mat& image, float factor);

/**
 * Blend a BGRA watermark onto a BGRA canvas at offset
 *
 * The watermark is clipped to the canvas; an offset that leaves no
 * overlap is a no-op.
 */
void paste(cv::Mat& canvas, const cv::Mat& watermark, cv::Point offset);

/**
 * Composite overlay over base, both BGRA and of the same size
 *
 * @throws WatermarkError(SizeMismatch) when sizes differ
 */
cv::Mat alpha_composite(const cv::Mat& base, const cv::Mat& overlay);

/**
 * Put the watermark onto the base image
 *
 * The watermark is pasted once per placement offset onto a transparent
 * layer the size of the base, then the layer is composited over the base
 * once. Overlapping tiles are pasted in iteration order, so later tiles
 * sit on top. Inputs are not modified.
 *
 * @param base       Base image (any channel layout)
 * @param watermark  Rescaled, opacity-adjusted watermark
 * @param placement  Single offset or tile grid
 * @return           BGRA result, same size as base
 *
 * @throws WatermarkError(SizeMismatch)  watermark larger than base (SINGLE)
 * @throws WatermarkError(OutOfBounds)   single offset outside the base
 */
cv::Mat compose(const cv::Mat& base, const cv::Mat& watermark, const Placement& placement);

} // namespace wmk
