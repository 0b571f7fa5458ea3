#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/processing_result.hpp"

/**
 * @brief Filesystem boundary for inputs and outputs of the processing pipeline
 *
 * Inputs are resolved against the upload root; outputs are written to
 * <upload_root>/inferences/<user_id>/ under names prefixed with a random UUID so
 * that concurrent writers never collide. Every returned output path is relative
 * to the upload root.
 */
class ArtifactStore
{
public:
    static constexpr const char *OUTPUT_SUBDIRECTORY = "inferences";
    static constexpr const char *VIDEO_EXTENSION = ".mp4";
    static constexpr const char *DEFAULT_IMAGE_EXTENSION = ".png";

    explicit ArtifactStore(const std::string &upload_root);

    /**
     * @brief Resolve a path relative to the upload root
     * @return Absolute path inside the root, or MALFORMED_RECORD for empty,
     *         absolute or escaping paths
     */
    Result<std::filesystem::path> resolve(const std::string &relative_path) const;

    /**
     * @brief Resolve and decode an input raster as 3-channel color
     * @return The raster, or DECODE_ERROR if the file is missing or corrupt
     */
    Result<cv::Mat> loadRaster(const std::string &relative_path) const;

    /**
     * @brief Encode and persist an output image
     * @param raster Image to encode (format chosen from the name's extension)
     * @param user_id Owner of the artifact; becomes the output sub-directory
     * @param suggested_name File name to prefix with a unique token
     * @return Path relative to the upload root, or IO_ERROR
     */
    Result<std::string> saveImage(const cv::Mat &raster, const std::string &user_id, const std::string &suggested_name) const;

    /**
     * @brief Encode frame files into one fixed-rate MP4 container
     * @param frames Frame image files, in playback order; all must share dimensions
     * @param fps Output frame rate
     * @param user_id Owner of the artifact
     * @param video_id Identifier embedded in the output name
     * @return Path relative to the upload root, EMPTY_SEQUENCE for no frames, or IO_ERROR
     */
    Result<std::string> saveVideo(const std::vector<std::filesystem::path> &frames, double fps,
                                  const std::string &user_id, const std::string &video_id) const;

    const std::filesystem::path &uploadRoot() const { return upload_root_; }
    std::filesystem::path outputRoot() const { return upload_root_ / OUTPUT_SUBDIRECTORY; }

    // Replace anything outside [A-Za-z0-9._-] so the value can be embedded in a file name
    static std::string sanitizeNameComponent(const std::string &value);

private:
    Result<std::filesystem::path> ensureUserDirectory(const std::string &user_id) const;
    std::string toRelative(const std::filesystem::path &absolute) const;
    static std::string newToken();

    std::filesystem::path upload_root_;
};
