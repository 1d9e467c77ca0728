#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace GenEvo {

namespace fs = std::filesystem;

namespace {
std::optional<fs::path> envDir(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return fs::path(value);
}

bool isFile(const fs::path& path)
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}
} // namespace

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_.reset();
}

std::vector<fs::path> ConfigLoader::getSearchPaths()
{
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.emplace_back(*explicitConfigDir_);
    }
    if (auto dir = envDir("GENEVO_CONFIG_DIR")) {
        paths.push_back(*dir);
    }

    paths.push_back(fs::current_path() / "config");

    if (auto xdg = envDir("XDG_CONFIG_HOME")) {
        paths.push_back(*xdg / "genevo");
    }
    else if (auto home = envDir("HOME")) {
        paths.push_back(*home / ".config" / "genevo");
    }

    paths.emplace_back("/etc/genevo");
    return paths;
}

std::string ConfigLoader::describeSearchPaths()
{
    std::ostringstream out;
    const auto paths = getSearchPaths();
    for (size_t i = 0; i < paths.size(); i++) {
        out << (i == 0 ? "" : ", ") << paths[i].string();
    }
    return out.str();
}

std::optional<fs::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    for (const auto& dir : getSearchPaths()) {
        for (const auto& candidate : { dir / (filename + ".local"), dir / filename }) {
            if (isFile(candidate)) {
                LOG_DEBUG(Config, "ConfigLoader: {} resolved to {}", filename, candidate.string());
                return candidate;
            }
        }
    }
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::tryLoadJson(const fs::path& path)
{
    using R = Result<nlohmann::json, std::string>;

    auto fail = [&path](const std::string& what) {
        std::string error = what + path.string();
        LOG_WARN(Config, "ConfigLoader: {}", error);
        return R::error(error);
    };

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return fail("Cannot stat config file: ");
    }
    if (size == 0) {
        return fail("Empty config file: ");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return fail("Cannot open config file: ");
    }

    try {
        return R::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        std::string error = "Parse error in " + path.string() + ": " + e.what();
        LOG_ERROR(Config, "ConfigLoader: {}", error);
        return R::error(error);
    }
}

Result<nlohmann::json, std::string> ConfigLoader::loadJson(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        std::string error =
            "Config file not found: " + filename + " (searched " + describeSearchPaths() + ")";
        LOG_DEBUG(Config, "ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    LOG_INFO(Config, "ConfigLoader: Loading {}", path->string());
    return tryLoadJson(*path);
}

} // namespace GenEvo
