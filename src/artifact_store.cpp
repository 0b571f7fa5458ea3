#include "core/artifact_store.hpp"
#include "core/dataset_types.hpp"
#include "logging/logger.hpp"
#include <Poco/UUIDGenerator.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

ArtifactStore::ArtifactStore(const std::string &upload_root)
{
    fs::path root = fs::absolute(fs::path(upload_root)).lexically_normal();
    // "/srv/uploads/" normalizes with an empty trailing element
    if (root.filename().empty() && root.has_parent_path())
    {
        root = root.parent_path();
    }
    upload_root_ = root;
}

Result<fs::path> ArtifactStore::resolve(const std::string &relative_path) const
{
    if (relative_path.empty())
    {
        return Result<fs::path>::fail(ErrorKind::MALFORMED_RECORD, "Empty path");
    }

    fs::path relative(relative_path);
    if (relative.is_absolute() || relative.has_root_name())
    {
        return Result<fs::path>::fail(ErrorKind::MALFORMED_RECORD, "Absolute path not allowed: " + relative_path);
    }

    fs::path candidate = (upload_root_ / relative).lexically_normal();
    fs::path inside = candidate.lexically_relative(upload_root_);
    if (inside.empty() || inside == "." || *inside.begin() == "..")
    {
        return Result<fs::path>::fail(ErrorKind::MALFORMED_RECORD, "Path escapes upload root: " + relative_path);
    }
    return Result<fs::path>::ok(candidate);
}

Result<cv::Mat> ArtifactStore::loadRaster(const std::string &relative_path) const
{
    auto resolved = resolve(relative_path);
    if (!resolved)
    {
        return Result<cv::Mat>::failFrom(resolved);
    }

    try
    {
        cv::Mat raster = cv::imread(resolved.value.string(), cv::IMREAD_COLOR);
        if (raster.empty())
        {
            return Result<cv::Mat>::fail(ErrorKind::DECODE_ERROR, "Could not load image: " + relative_path);
        }
        return Result<cv::Mat>::ok(raster);
    }
    catch (const cv::Exception &e)
    {
        return Result<cv::Mat>::fail(ErrorKind::DECODE_ERROR, "Could not decode " + relative_path + ": " + e.what());
    }
}

Result<std::string> ArtifactStore::saveImage(const cv::Mat &raster, const std::string &user_id,
                                             const std::string &suggested_name) const
{
    if (raster.empty())
    {
        return Result<std::string>::fail(ErrorKind::IO_ERROR, "Refusing to save an empty raster");
    }

    auto directory = ensureUserDirectory(user_id);
    if (!directory)
    {
        return Result<std::string>::failFrom(directory);
    }

    std::string name = sanitizeNameComponent(fs::path(suggested_name).filename().string());
    if (name.empty() || name == "." || name == "..")
    {
        name = "output";
    }
    if (fs::path(name).extension().empty())
    {
        name += DEFAULT_IMAGE_EXTENSION;
    }

    fs::path output_path = directory.value / (newToken() + "_" + name);
    try
    {
        if (!cv::imwrite(output_path.string(), raster))
        {
            return Result<std::string>::fail(ErrorKind::IO_ERROR, "Failed to write image: " + output_path.string());
        }
    }
    catch (const cv::Exception &e)
    {
        std::error_code ec;
        fs::remove(output_path, ec);
        return Result<std::string>::fail(ErrorKind::IO_ERROR, "Failed to encode image " + output_path.string() + ": " + e.what());
    }

    Logger::debug("Saved image artifact: " + output_path.string());
    return Result<std::string>::ok(toRelative(output_path));
}

Result<std::string> ArtifactStore::saveVideo(const std::vector<fs::path> &frames, double fps,
                                             const std::string &user_id, const std::string &video_id) const
{
    if (frames.empty())
    {
        return Result<std::string>::fail(ErrorKind::EMPTY_SEQUENCE, "No frames to encode for video " + video_id);
    }
    if (fps <= 0.0)
    {
        return Result<std::string>::fail(ErrorKind::IO_ERROR, "Invalid frame rate: " + std::to_string(fps));
    }

    auto directory = ensureUserDirectory(user_id);
    if (!directory)
    {
        return Result<std::string>::failFrom(directory);
    }

    fs::path output_path = directory.value / (newToken() + "_video_" + sanitizeNameComponent(video_id) + VIDEO_EXTENSION);

    auto discard = [&output_path](const std::string &message)
    {
        std::error_code ec;
        fs::remove(output_path, ec);
        return Result<std::string>::fail(ErrorKind::IO_ERROR, message);
    };

    try
    {
        cv::Mat first = cv::imread(frames.front().string(), cv::IMREAD_COLOR);
        if (first.empty())
        {
            return Result<std::string>::fail(ErrorKind::IO_ERROR, "Cannot read frame " + frames.front().string());
        }
        const cv::Size frame_size = first.size();

        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('m', 'p', '4', 'v');
        if (!writer.open(output_path.string(), fourcc, fps, frame_size, true) || !writer.isOpened())
        {
            return discard("Failed to open video writer: " + output_path.string());
        }

        writer.write(first);
        for (size_t i = 1; i < frames.size(); ++i)
        {
            cv::Mat frame = cv::imread(frames[i].string(), cv::IMREAD_COLOR);
            if (frame.empty())
            {
                writer.release();
                return discard("Cannot read frame " + frames[i].string());
            }
            if (frame.size() != frame_size)
            {
                writer.release();
                return discard("Frame " + frames[i].string() + " does not match the video dimensions");
            }
            writer.write(frame);
        }
        writer.release();
    }
    catch (const cv::Exception &e)
    {
        return discard("Failed to encode video " + output_path.string() + ": " + e.what());
    }

    std::error_code ec;
    if (!fs::exists(output_path, ec) || fs::file_size(output_path, ec) == 0 || ec)
    {
        return discard("Video encoder produced no output: " + output_path.string());
    }

    Logger::debug("Saved video artifact: " + output_path.string() + " (" + std::to_string(frames.size()) +
                  " frames at " + std::to_string(fps) + " fps)");
    return Result<std::string>::ok(toRelative(output_path));
}

std::string ArtifactStore::sanitizeNameComponent(const std::string &value)
{
    std::string clean = value;
    for (char &c : clean)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '_' && c != '-')
        {
            c = '_';
        }
    }
    return clean;
}

Result<fs::path> ArtifactStore::ensureUserDirectory(const std::string &user_id) const
{
    if (!DatasetCodec::isSafeUserId(user_id))
    {
        return Result<fs::path>::fail(ErrorKind::IO_ERROR, "Invalid user id for output directory: " + user_id);
    }

    fs::path directory = outputRoot() / user_id;
    std::error_code ec;
    // create_directories reports "already exists" as success, so concurrent creators do not fail
    fs::create_directories(directory, ec);
    if (ec || !fs::is_directory(directory, ec))
    {
        return Result<fs::path>::fail(ErrorKind::IO_ERROR,
                                      "Cannot create output directory " + directory.string() +
                                          (ec ? ": " + ec.message() : ""));
    }
    return Result<fs::path>::ok(directory);
}

std::string ArtifactStore::toRelative(const fs::path &absolute) const
{
    return absolute.lexically_relative(upload_root_).generic_string();
}

std::string ArtifactStore::newToken()
{
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}
