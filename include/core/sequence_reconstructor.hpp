#pragma once

#include <memory>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/artifact_store.hpp"
#include "core/dataset_types.hpp"
#include "core/processing_result.hpp"

/**
 * @brief Rebuilds one video from a group of image/mask frame records
 *
 * Frames are ordered by frame index, blended one by one into a scratch
 * directory and encoded at FRAMES_PER_SECOND. Frames that fail to load or
 * blend are skipped; the group fails with EMPTY_SEQUENCE only if none remain.
 *
 * Output dimensions are taken from the first blended frame. Later frames of a
 * different size are placed at the top-left of a black canvas of that size:
 * overflow is cropped, shortfall is padded.
 */
class SequenceReconstructor
{
public:
    // Frames were sampled once per second from the source video
    static constexpr double FRAMES_PER_SECOND = 1.0;

    explicit SequenceReconstructor(std::shared_ptr<const ArtifactStore> store);

    /**
     * @brief Blend and encode a frame group
     * @param group Frame records of one upload; order in the vector is irrelevant
     * @param user_id Owner of the output video
     * @param video_id Identifier embedded in the output name
     * @return Output path relative to the upload root
     */
    Result<std::string> reconstruct(FrameGroup group, const std::string &user_id, const std::string &video_id) const;

    /**
     * @brief Stable sort by ascending frame index; equal indices keep submission order
     */
    static void orderFrames(std::vector<PairRecord> &frames);

    /**
     * @brief Crop/pad a frame to the given size, anchored at the top-left corner
     */
    static cv::Mat conformToSize(const cv::Mat &frame, const cv::Size &size);

private:
    std::shared_ptr<const ArtifactStore> store_;
};
