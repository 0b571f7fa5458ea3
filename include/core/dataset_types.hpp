#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/processing_result.hpp"

/**
 * @brief One image/mask pair submitted for processing
 *
 * A record with a frame index belongs to the video identified by upload_index;
 * a record without one is a standalone image.
 */
struct PairRecord
{
    std::string image_path;
    std::string mask_path;
    std::string upload_index;
    std::optional<long long> frame_index;
    size_t submission_order = 0;

    bool isFrame() const { return frame_index.has_value(); }
};

/**
 * @brief Frame records sharing one upload index, reconstructed into one video
 */
struct FrameGroup
{
    std::string upload_index;
    std::vector<PairRecord> frames;
};

/**
 * @brief An item excluded from the report, kept for logging and accounting
 */
struct ItemFailure
{
    std::string subject;
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
};

/**
 * @brief Records submitted in one request
 *
 * Records that could not be parsed are kept in `malformed` so that they are
 * accounted for as skipped items rather than silently dropped.
 */
struct DatasetBatch
{
    std::vector<PairRecord> pairs;
    std::vector<ItemFailure> malformed;

    size_t submittedCount() const { return pairs.size() + malformed.size(); }
};

/**
 * @brief Request envelope; `data` is parsed into a DatasetBatch by the orchestrator
 */
struct DatasetRequest
{
    std::string user_id;
    nlohmann::json data;
};

struct ProcessedImageResult
{
    std::string original_path;
    std::string output_path;
};

struct ProcessedVideoResult
{
    std::string original_video_id;
    std::string output_path;
};

struct BatchReport
{
    bool success = false;
    std::string error;
    std::vector<ProcessedImageResult> images;
    std::vector<ProcessedVideoResult> videos;
    std::vector<ItemFailure> failures;

    static BatchReport fatal(const std::string &message)
    {
        BatchReport report;
        report.success = false;
        report.error = message;
        return report;
    }
};

/**
 * @brief JSON request parsing and report serialization
 */
class DatasetCodec
{
public:
    static constexpr const char *NO_JSON_DATA = "No JSON data provided";
    static constexpr const char *MISSING_USER_OR_DATA = "Missing userId or data";

    /**
     * @brief Parse a single pair object
     * @param node JSON object with imagePath, maskPath, uploadIndex and optional frameIndex
     * @param position Submission position of the record in the pairs array
     * @return The record, or MALFORMED_RECORD describing the first missing/invalid field
     */
    static Result<PairRecord> parsePairRecord(const nlohmann::json &node, size_t position);

    /**
     * @brief Parse the `data` object of a request into a batch
     *
     * A missing `pairs` key is an empty batch. A `pairs` value that is not an
     * array is a structural failure. Individual malformed records are collected
     * in DatasetBatch::malformed.
     */
    static Result<DatasetBatch> parseDatasetBatch(const nlohmann::json &data);

    /**
     * @brief Validate the request envelope `{ userId, data }`
     * @return The envelope, or MALFORMED_RECORD with NO_JSON_DATA, MISSING_USER_OR_DATA
     *         or an invalid-userId message
     *
     * An empty `data` (null, false, 0, "", {} or []) is treated as missing.
     */
    static Result<DatasetRequest> parseDatasetRequest(const nlohmann::json &body);

    /**
     * @brief Check that a user id can be used as a single directory name
     */
    static bool isSafeUserId(const std::string &user_id);

    static nlohmann::json toJson(const ProcessedImageResult &image);
    static nlohmann::json toJson(const ProcessedVideoResult &video);

    /**
     * @brief Serialize the report in the response shape
     *
     * Success: { success: true, images: [...], videos: [...] }.
     * Failure: { success: false, error: "..." }.
     */
    static nlohmann::json toJson(const BatchReport &report);
};
