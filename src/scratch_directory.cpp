#include "core/scratch_directory.hpp"
#include "logging/logger.hpp"
#include <Poco/UUIDGenerator.h>
#include <cstdio>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

ScratchDirectory::ScratchDirectory(const std::string &prefix)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec)
    {
        throw std::runtime_error("Cannot locate temp directory: " + ec.message());
    }

    path_ = base / (prefix + "_" + Poco::UUIDGenerator::defaultGenerator().createRandom().toString());
    if (!fs::create_directories(path_, ec) || ec)
    {
        throw std::runtime_error("Cannot create scratch directory " + path_.string() + ": " + ec.message());
    }
    Logger::debug("Created scratch directory: " + path_.string());
}

ScratchDirectory::~ScratchDirectory()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
    {
        Logger::warn("Failed to remove scratch directory " + path_.string() + ": " + ec.message());
    }
    else
    {
        Logger::debug("Removed scratch directory: " + path_.string());
    }
}

fs::path ScratchDirectory::framePath(size_t position) const
{
    char name[32];
    std::snprintf(name, sizeof(name), "frame_%06zu.png", position);
    return path_ / name;
}
