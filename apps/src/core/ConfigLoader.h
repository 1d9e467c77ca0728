#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace GenEvo {

/**
 * @brief Finds and parses JSON config files for runs and logging.
 *
 * Directories are searched in order, first match wins:
 * 1. Directory set via setConfigDir (tests, --config-dir)
 * 2. $GENEVO_CONFIG_DIR
 * 3. ./config/
 * 4. $XDG_CONFIG_HOME/genevo/, or ~/.config/genevo/ when unset
 * 5. /etc/genevo/
 *
 * Inside a directory, onemax.json.local shadows onemax.json completely
 * (no merging). T is parsed through its ADL from_json.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    template <typename T>
    static Result<T, std::string> loadFromPath(const std::filesystem::path& path);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();
    static std::string describeSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> loadJson(const std::string& filename);
    static Result<nlohmann::json, std::string> tryLoadJson(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> parse(
        const Result<nlohmann::json, std::string>& jsonResult, const std::string& name);
};

template <typename T>
Result<T, std::string> ConfigLoader::parse(
    const Result<nlohmann::json, std::string>& jsonResult, const std::string& name)
{
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }

    try {
        T config;
        // Use unqualified call to enable ADL (argument-dependent lookup).
        from_json(jsonResult.value(), config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + name + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    return parse<T>(loadJson(filename), filename);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadFromPath(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        return Result<T, std::string>::error("Config file not found: " + path.string());
    }
    return parse<T>(tryLoadJson(path), path.string());
}

} // namespace GenEvo
