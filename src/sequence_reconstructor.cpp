#include "core/sequence_reconstructor.hpp"
#include "core/raster_blender.hpp"
#include "core/scratch_directory.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <exception>

namespace fs = std::filesystem;

SequenceReconstructor::SequenceReconstructor(std::shared_ptr<const ArtifactStore> store)
    : store_(std::move(store))
{
}

void SequenceReconstructor::orderFrames(std::vector<PairRecord> &frames)
{
    std::stable_sort(frames.begin(), frames.end(), [](const PairRecord &a, const PairRecord &b)
                     { return a.frame_index.value_or(0) < b.frame_index.value_or(0); });
}

cv::Mat SequenceReconstructor::conformToSize(const cv::Mat &frame, const cv::Size &size)
{
    if (frame.size() == size)
    {
        return frame;
    }

    cv::Mat canvas = cv::Mat::zeros(size, frame.type());
    cv::Rect overlap(0, 0, std::min(frame.cols, size.width), std::min(frame.rows, size.height));
    frame(overlap).copyTo(canvas(overlap));
    return canvas;
}

Result<std::string> SequenceReconstructor::reconstruct(FrameGroup group, const std::string &user_id,
                                                       const std::string &video_id) const
{
    orderFrames(group.frames);

    Logger::info("Reconstructing video " + video_id + " from " + std::to_string(group.frames.size()) + " frames");

    try
    {
        ScratchDirectory scratch("inference_blackbox_frames");
        std::vector<fs::path> frame_files;
        frame_files.reserve(group.frames.size());
        cv::Size frame_size;

        for (const auto &frame : group.frames)
        {
            const std::string frame_label = "frame " + std::to_string(frame.frame_index.value_or(0)) +
                                            " of video " + video_id;

            auto image = store_->loadRaster(frame.image_path);
            if (!image)
            {
                Logger::warn("Skipping " + frame_label + ": " + image.error_message);
                continue;
            }
            auto mask = store_->loadRaster(frame.mask_path);
            if (!mask)
            {
                Logger::warn("Skipping " + frame_label + ": " + mask.error_message);
                continue;
            }
            auto blended = RasterBlender::blend(image.value, mask.value);
            if (!blended)
            {
                Logger::warn("Skipping " + frame_label + ": " + blended.error_message);
                continue;
            }

            cv::Mat output = blended.value;
            if (frame_files.empty())
            {
                frame_size = output.size();
            }
            else if (output.size() != frame_size)
            {
                Logger::warn("Frame size " + std::to_string(output.cols) + "x" + std::to_string(output.rows) +
                             " differs from " + std::to_string(frame_size.width) + "x" +
                             std::to_string(frame_size.height) + " in " + frame_label + ", cropping/padding");
                output = conformToSize(output, frame_size);
            }

            fs::path frame_path = scratch.framePath(frame_files.size());
            if (!cv::imwrite(frame_path.string(), output))
            {
                return Result<std::string>::fail(ErrorKind::IO_ERROR, "Failed to write scratch frame " + frame_path.string());
            }
            frame_files.push_back(frame_path);
        }

        if (frame_files.empty())
        {
            return Result<std::string>::fail(ErrorKind::EMPTY_SEQUENCE, "No frames to process for video " + video_id);
        }

        return store_->saveVideo(frame_files, FRAMES_PER_SECOND, user_id, video_id);
    }
    catch (const cv::Exception &e)
    {
        return Result<std::string>::fail(ErrorKind::IO_ERROR, "OpenCV error reconstructing video " + video_id + ": " + e.what());
    }
    catch (const std::exception &e)
    {
        return Result<std::string>::fail(ErrorKind::IO_ERROR, "Error reconstructing video " + video_id + ": " + e.what());
    }
}
