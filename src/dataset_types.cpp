#include "core/dataset_types.hpp"
#include <algorithm>
#include <limits>

using json = nlohmann::json;

namespace
{
    // null, false, 0, "", {} and [] all count as "no data"
    bool isEmptyValue(const json &value)
    {
        if (value.is_null())
            return true;
        if (value.is_boolean())
            return !value.get<bool>();
        if (value.is_number())
            return value == 0;
        if (value.is_string())
            return value.get_ref<const std::string &>().empty();
        return value.is_structured() && value.empty();
    }

    std::string describeRecord(size_t position)
    {
        return "pairs[" + std::to_string(position) + "]";
    }

    bool readRequiredPath(const json &node, const char *key, std::string &out)
    {
        auto it = node.find(key);
        if (it == node.end() || !it->is_string())
            return false;
        out = it->get<std::string>();
        return !out.empty();
    }

    // uploadIndex is an identifier; integers and strings share one text key space
    bool readIdentifier(const json &node, const char *key, std::string &out)
    {
        auto it = node.find(key);
        if (it == node.end() || it->is_null())
            return false;
        if (it->is_string())
        {
            out = it->get<std::string>();
            return !out.empty();
        }
        if (it->is_number_integer())
        {
            out = it->is_number_unsigned() ? std::to_string(it->get<unsigned long long>())
                                           : std::to_string(it->get<long long>());
            return true;
        }
        return false;
    }
}

Result<PairRecord> DatasetCodec::parsePairRecord(const json &node, size_t position)
{
    const std::string where = describeRecord(position);
    if (!node.is_object())
    {
        return Result<PairRecord>::fail(ErrorKind::MALFORMED_RECORD, where + " is not an object");
    }

    PairRecord record;
    record.submission_order = position;

    if (!readRequiredPath(node, "imagePath", record.image_path))
    {
        return Result<PairRecord>::fail(ErrorKind::MALFORMED_RECORD, where + " is missing imagePath");
    }
    if (!readRequiredPath(node, "maskPath", record.mask_path))
    {
        return Result<PairRecord>::fail(ErrorKind::MALFORMED_RECORD, where + " is missing maskPath");
    }

    bool has_upload_index = readIdentifier(node, "uploadIndex", record.upload_index);

    auto frame_it = node.find("frameIndex");
    if (frame_it != node.end() && !frame_it->is_null())
    {
        if (!frame_it->is_number_integer())
        {
            return Result<PairRecord>::fail(ErrorKind::MALFORMED_RECORD, where + " has a non-integer frameIndex");
        }
        if (frame_it->is_number_unsigned() &&
            frame_it->get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<long long>::max()))
        {
            return Result<PairRecord>::fail(ErrorKind::MALFORMED_RECORD, where + " has an out-of-range frameIndex");
        }
        if (!has_upload_index)
        {
            return Result<PairRecord>::fail(ErrorKind::MALFORMED_RECORD, where + " is a frame without uploadIndex");
        }
        record.frame_index = frame_it->get<long long>();
    }

    return Result<PairRecord>::ok(std::move(record));
}

Result<DatasetBatch> DatasetCodec::parseDatasetBatch(const json &data)
{
    if (!data.is_object())
    {
        return Result<DatasetBatch>::fail(ErrorKind::MALFORMED_RECORD, "Malformed dataset: data must be an object");
    }

    DatasetBatch batch;
    auto pairs_it = data.find("pairs");
    if (pairs_it == data.end() || pairs_it->is_null())
    {
        return Result<DatasetBatch>::ok(std::move(batch));
    }
    if (!pairs_it->is_array())
    {
        return Result<DatasetBatch>::fail(ErrorKind::MALFORMED_RECORD, "Malformed dataset: pairs must be an array");
    }

    size_t position = 0;
    for (const auto &node : *pairs_it)
    {
        auto parsed = parsePairRecord(node, position);
        if (parsed)
        {
            batch.pairs.push_back(std::move(parsed.value));
        }
        else
        {
            batch.malformed.push_back({describeRecord(position), parsed.error_kind, parsed.error_message});
        }
        ++position;
    }
    return Result<DatasetBatch>::ok(std::move(batch));
}

Result<DatasetRequest> DatasetCodec::parseDatasetRequest(const json &body)
{
    if (!body.is_object())
    {
        return Result<DatasetRequest>::fail(ErrorKind::MALFORMED_RECORD, NO_JSON_DATA);
    }

    auto user_it = body.find("userId");
    auto data_it = body.find("data");
    if (user_it == body.end() || data_it == body.end() || isEmptyValue(*data_it))
    {
        return Result<DatasetRequest>::fail(ErrorKind::MALFORMED_RECORD, MISSING_USER_OR_DATA);
    }

    DatasetRequest request;
    if (!readIdentifier(body, "userId", request.user_id))
    {
        return Result<DatasetRequest>::fail(ErrorKind::MALFORMED_RECORD, MISSING_USER_OR_DATA);
    }
    if (!isSafeUserId(request.user_id))
    {
        return Result<DatasetRequest>::fail(ErrorKind::MALFORMED_RECORD, "Invalid userId: " + request.user_id);
    }

    request.data = *data_it;
    return Result<DatasetRequest>::ok(std::move(request));
}

bool DatasetCodec::isSafeUserId(const std::string &user_id)
{
    if (user_id.empty() || user_id == "." || user_id == "..")
        return false;
    return std::none_of(user_id.begin(), user_id.end(), [](char c)
                        { return c == '/' || c == '\\' || c == '\0'; });
}

json DatasetCodec::toJson(const ProcessedImageResult &image)
{
    return json{{"originalPath", image.original_path}, {"outputPath", image.output_path}};
}

json DatasetCodec::toJson(const ProcessedVideoResult &video)
{
    return json{{"originalVideoId", video.original_video_id}, {"outputPath", video.output_path}};
}

json DatasetCodec::toJson(const BatchReport &report)
{
    json result;
    result["success"] = report.success;
    if (!report.success)
    {
        result["error"] = report.error;
        return result;
    }

    result["images"] = json::array();
    for (const auto &image : report.images)
    {
        result["images"].push_back(toJson(image));
    }
    result["videos"] = json::array();
    for (const auto &video : report.videos)
    {
        result["videos"].push_back(toJson(video));
    }
    return result;
}
