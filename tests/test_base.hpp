#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>
#include <Poco/UUIDGenerator.h>
#include "core/artifact_store.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need an upload root with synthetic images
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");

        upload_root_ = std::filesystem::temp_directory_path() /
                       ("inference_blackbox_test_" + Poco::UUIDGenerator::defaultGenerator().createRandom().toString());
        std::filesystem::create_directories(upload_root_);
        store_ = std::make_shared<const ArtifactStore>(upload_root_.string());
    }

    void TearDown() override
    {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(upload_root_, ec);
    }

    // Write a solid-color BGR image under the upload root and return its relative path
    std::string createImage(const std::string &relative_path, int width, int height, const cv::Scalar &color)
    {
        std::filesystem::path full = upload_root_ / relative_path;
        std::filesystem::create_directories(full.parent_path());
        cv::Mat image(height, width, CV_8UC3, color);
        EXPECT_TRUE(cv::imwrite(full.string(), image)) << "could not write " << full;
        return relative_path;
    }

    std::string createGrayImage(const std::string &relative_path, int width, int height, int value)
    {
        return createImage(relative_path, width, height, cv::Scalar(value, value, value));
    }

    // A text file with an image extension; imread fails on it
    std::string createCorruptFile(const std::string &relative_path)
    {
        std::filesystem::path full = upload_root_ / relative_path;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream ofs(full);
        ofs << "this is not an image";
        ofs.close();
        return relative_path;
    }

    std::filesystem::path absolute(const std::string &relative_path) const
    {
        return upload_root_ / relative_path;
    }

    // True when the local OpenCV build can write mp4v into an .mp4 container
    bool canEncodeMp4() const
    {
        std::filesystem::path probe = upload_root_ / "probe.mp4";
        bool ok = false;
        {
            cv::VideoWriter writer;
            ok = writer.open(probe.string(), cv::VideoWriter::fourcc('m', 'p', '4', 'v'), 1.0, cv::Size(16, 16), true) &&
                 writer.isOpened();
            if (ok)
            {
                writer.write(cv::Mat(16, 16, CV_8UC3, cv::Scalar(0, 0, 0)));
            }
        }
        std::error_code ec;
        std::filesystem::remove(probe, ec);
        return ok;
    }

    std::filesystem::path upload_root_;
    std::shared_ptr<const ArtifactStore> store_;
};
