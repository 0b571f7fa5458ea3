#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

/**
 * @brief Temporary directory owned by one reconstruction
 *
 * Created under the system temp directory with a unique name and removed,
 * with everything in it, when the object goes out of scope.
 * The constructor throws std::runtime_error if the directory cannot be created.
 */
class ScratchDirectory
{
public:
    explicit ScratchDirectory(const std::string &prefix);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory &) = delete;
    ScratchDirectory &operator=(const ScratchDirectory &) = delete;

    const std::filesystem::path &path() const { return path_; }

    // frame_000000.png, frame_000001.png, ... so that lexical order equals playback order
    std::filesystem::path framePath(size_t position) const;

private:
    std::filesystem::path path_;
};
