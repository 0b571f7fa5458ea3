#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Service configuration backed by Poco's JSONConfiguration
 *
 * Values are layered: built-in defaults, then a JSON file (load), then
 * INFERENCE_BLACKBOX_* environment variables (applyEnvironmentOverrides).
 * Keys are dotted paths into the JSON document, e.g. "threading.max_processing_threads".
 */
class PocoConfigManager
{
public:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    /**
     * @brief Overlay INFERENCE_BLACKBOX_UPLOAD_DIR, _LOG_LEVEL, _HOST and _PORT when set
     * @return Number of keys overridden
     */
    int applyEnvironmentOverrides();

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;

    // Service configuration getters
    std::string getUploadDir() const;
    std::string getLogLevel() const;
    std::string getServerHost() const;
    int getServerPort() const;
    int getMaxProcessingThreads() const;
    int getItemTimeoutSeconds() const;
    int getMaxAbandonedWorkers() const;

    /**
     * @brief Check every service value for range and format
     * @param errors Receives one message per invalid value
     */
    bool validateConfig(std::vector<std::string> &errors) const;
    bool validateConfig() const;

    void initializeDefaultConfig();
    bool hasKey(const std::string &key) const;

private:
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
