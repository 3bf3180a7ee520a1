#include "util/config_json_utils.hpp"

#include <cstdint>
#include <fstream>

namespace extupd::config::detail {

namespace {

// Returns false only when the key is present with the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
        err = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = static_cast<std::uint64_t>(it->get<std::int64_t>());
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be true or false";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UpdaterConfigFromFile& cfg, std::string& err) {
    const bool strings_ok = GetStringIfPresent(j, "ExtensionsDir", cfg.extensions_dir, err) &&
                            GetStringIfPresent(j, "BuildNumber", cfg.build_number, err) &&
                            GetStringIfPresent(j, "TempDir", cfg.temp_dir, err) &&
                            GetStringIfPresent(j, "ActionScript", cfg.action_script, err) &&
                            GetStringIfPresent(j, "InstallationIdFile", cfg.installation_id_file, err) &&
                            GetStringIfPresent(j, "BrokenList", cfg.broken_list, err) &&
                            GetStringIfPresent(j, "RepositoryUrl", cfg.repository_url, err) &&
                            GetStringIfPresent(j, "ProgressFile", cfg.progress_file, err) &&
                            GetStringIfPresent(j, "LogLevel", cfg.log_level, err) &&
                            GetStringIfPresent(j, "LogFile", cfg.log_file, err);
    if (!strings_ok)
        return false;

    if (!GetBoolIfPresent(j, "ForceHttps", cfg.force_https, err) ||
        !GetBoolIfPresent(j, "FirstLaunch", cfg.first_launch, err) ||
        !GetBoolIfPresent(j, "Progress", cfg.progress, err) ||
        !GetU64IfPresent(j, "ConnectTimeoutSec", cfg.connect_timeout_sec, err)) {
        return false;
    }

    if (cfg.extensions_dir.empty()) {
        err = "missing ExtensionsDir";
        return false;
    }
    if (cfg.build_number.empty()) {
        err = "missing BuildNumber";
        return false;
    }
    if (cfg.temp_dir.empty()) {
        err = "TempDir must not be empty";
        return false;
    }
    if (cfg.temp_dir == cfg.extensions_dir) {
        err = "TempDir and ExtensionsDir must differ";
        return false;
    }

    return true;
}

} // namespace extupd::config::detail
