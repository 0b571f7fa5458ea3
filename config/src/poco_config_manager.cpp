#include "poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::warn("Configuration file not found: " + path);
        return false;
    }

    try
    {
        std::stringstream buffer;
        buffer << in.rdbuf();
        nlohmann::json patch = nlohmann::json::parse(buffer.str());
        // Overlay on defaults rather than replacing the whole document
        update(patch);
        Logger::info("Loaded configuration from " + path);
        return true;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Invalid configuration file " + path + ": " + e.what());
        return false;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to apply configuration file " + path + ": " + e.displayText());
        return false;
    }
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

int PocoConfigManager::applyEnvironmentOverrides()
{
    struct EnvBinding
    {
        const char *variable;
        const char *key;
        bool numeric;
    };
    static const EnvBinding bindings[] = {
        {"INFERENCE_BLACKBOX_UPLOAD_DIR", "upload_dir", false},
        {"INFERENCE_BLACKBOX_LOG_LEVEL", "log_level", false},
        {"INFERENCE_BLACKBOX_HOST", "server_host", false},
        {"INFERENCE_BLACKBOX_PORT", "server_port", true},
    };

    int applied = 0;
    for (const auto &binding : bindings)
    {
        const char *value = std::getenv(binding.variable);
        if (value == nullptr || *value == '\0')
            continue;

        std::string text(value);
        if (binding.key == std::string("log_level"))
        {
            for (auto &c : text)
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (binding.numeric)
        {
            try
            {
                cfg_->setInt(binding.key, std::stoi(text));
            }
            catch (const std::exception &)
            {
                Logger::warn(std::string("Ignoring non-numeric ") + binding.variable + "=" + text);
                continue;
            }
        }
        else
        {
            cfg_->setString(binding.key, text);
        }
        ++applied;
    }
    return applied;
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

// Service configuration getters
std::string PocoConfigManager::getUploadDir() const
{
    return getString("upload_dir", "./uploads");
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getServerHost() const
{
    return getString("server_host", "0.0.0.0");
}

int PocoConfigManager::getServerPort() const
{
    return getInt("server_port", 5000);
}

int PocoConfigManager::getMaxProcessingThreads() const
{
    return getInt("threading.max_processing_threads", 1);
}

int PocoConfigManager::getItemTimeoutSeconds() const
{
    return getInt("processing.item_timeout_seconds", 300);
}

int PocoConfigManager::getMaxAbandonedWorkers() const
{
    return getInt("processing.max_abandoned_workers", 8);
}

bool PocoConfigManager::validateConfig(std::vector<std::string> &errors) const
{
    try
    {
        if (getUploadDir().empty())
            errors.push_back("upload_dir must not be empty");
        if (!Logger::isValidLevel(getLogLevel()))
            errors.push_back("log_level must be one of TRACE, DEBUG, INFO, WARN, ERROR");
        int port = getServerPort();
        if (port <= 0 || port > 65535)
            errors.push_back("server_port must be in 1..65535");
        if (getMaxProcessingThreads() < 1)
            errors.push_back("threading.max_processing_threads must be >= 1");
        if (getItemTimeoutSeconds() < 0)
            errors.push_back("processing.item_timeout_seconds must be >= 0");
        if (getMaxAbandonedWorkers() < 1)
            errors.push_back("processing.max_abandoned_workers must be >= 1");
    }
    catch (const Poco::Exception &e)
    {
        errors.push_back("Invalid configuration value: " + e.displayText());
    }
    return errors.empty();
}

bool PocoConfigManager::validateConfig() const
{
    std::vector<std::string> errors;
    bool valid = validateConfig(errors);
    for (const auto &error : errors)
    {
        Logger::error("Configuration error: " + error);
    }
    return valid;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("upload_dir", "./uploads");
    cfg_->setString("log_level", "INFO");
    cfg_->setString("server_host", "0.0.0.0");
    cfg_->setInt("server_port", 5000);

    // Threading defaults
    cfg_->setInt("threading.max_processing_threads", 1);

    // Processing defaults
    cfg_->setInt("processing.item_timeout_seconds", 300);
    cfg_->setInt("processing.max_abandoned_workers", 8);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}
