#include "core/raster_blender.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdint>
#include <string>

Result<cv::Mat> RasterBlender::toBgr(const cv::Mat &raster, const char *role)
{
    if (raster.empty())
    {
        return Result<cv::Mat>::fail(ErrorKind::DECODE_ERROR, std::string(role) + " raster is empty");
    }
    if (raster.depth() != CV_8U)
    {
        return Result<cv::Mat>::fail(ErrorKind::DECODE_ERROR, std::string(role) + " raster is not 8-bit");
    }

    cv::Mat bgr;
    switch (raster.channels())
    {
    case 1:
        cv::cvtColor(raster, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 3:
        bgr = raster;
        break;
    case 4:
        cv::cvtColor(raster, bgr, cv::COLOR_BGRA2BGR);
        break;
    default:
        return Result<cv::Mat>::fail(ErrorKind::DECODE_ERROR,
                                     std::string(role) + " raster has " + std::to_string(raster.channels()) + " channels");
    }
    return Result<cv::Mat>::ok(bgr);
}

Result<cv::Mat> RasterBlender::blend(const cv::Mat &image, const cv::Mat &mask)
{
    try
    {
        auto image_bgr = toBgr(image, "image");
        if (!image_bgr)
            return image_bgr;
        auto mask_bgr = toBgr(mask, "mask");
        if (!mask_bgr)
            return mask_bgr;

        const cv::Mat &img = image_bgr.value;
        cv::Mat msk = mask_bgr.value;

        if (msk.size() != img.size())
        {
            Logger::debug("Resampling mask from " + std::to_string(msk.cols) + "x" + std::to_string(msk.rows) +
                          " to " + std::to_string(img.cols) + "x" + std::to_string(img.rows));
            cv::Mat resized;
            cv::resize(msk, resized, img.size(), 0, 0, cv::INTER_LINEAR);
            msk = resized;
        }

        cv::Mat luminance;
        cv::cvtColor(msk, luminance, cv::COLOR_BGR2GRAY);

        cv::Mat output(img.rows, img.cols, CV_8UC3);
        for (int y = 0; y < img.rows; y++)
        {
            const uint8_t *img_row = img.ptr<uint8_t>(y);
            const uint8_t *msk_row = msk.ptr<uint8_t>(y);
            const uint8_t *lum_row = luminance.ptr<uint8_t>(y);
            uint8_t *out_row = output.ptr<uint8_t>(y);

            for (int x = 0; x < img.cols; x++)
            {
                const float w = (static_cast<float>(lum_row[x]) / 255.0f) * MASK_OPACITY;
                for (int c = 0; c < 3; c++)
                {
                    const int idx = x * 3 + c;
                    float v = static_cast<float>(img_row[idx]) * (1.0f - w) +
                              static_cast<float>(msk_row[idx]) * w;
                    v = std::min(std::max(v, 0.0f), 255.0f);
                    // Truncate toward zero after clipping: 191.5 -> 191
                    out_row[idx] = static_cast<uint8_t>(v);
                }
            }
        }

        return Result<cv::Mat>::ok(output);
    }
    catch (const cv::Exception &e)
    {
        return Result<cv::Mat>::fail(ErrorKind::DECODE_ERROR, "OpenCV error while blending: " + std::string(e.what()));
    }
}
