#pragma once

#include <opencv2/core.hpp>
#include "core/processing_result.hpp"

/**
 * @brief Deterministic placeholder transform combining an image with its mask
 *
 * The mask luminance, scaled by MASK_OPACITY, is used as a per-pixel weight:
 *   out = image * (1 - w) + mask * w,  w = luminance / 255 * MASK_OPACITY
 * Values are clipped to [0, 255] and truncated toward zero.
 */
class RasterBlender
{
public:
    static constexpr float MASK_OPACITY = 0.5f;

    /**
     * @brief Blend an image with a mask
     * @param image 8-bit raster (1, 3 or 4 channels)
     * @param mask 8-bit raster (1, 3 or 4 channels); resampled to the image size if needed
     * @return 3-channel BGR raster with the image's dimensions, or DECODE_ERROR
     */
    static Result<cv::Mat> blend(const cv::Mat &image, const cv::Mat &mask);

    /**
     * @brief Convert a decoded raster to 8-bit 3-channel BGR
     * @return Converted raster, or DECODE_ERROR for empty or unsupported inputs
     */
    static Result<cv::Mat> toBgr(const cv::Mat &raster, const char *role);
};
