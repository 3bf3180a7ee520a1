#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace extupd::config {

inline constexpr const char kDefaultConfigPath[] = "/etc/ext-updater/updater.conf";

class UpdaterConfigFromFile {
public:
    std::string extensions_dir;
    std::string build_number;

    std::string temp_dir = "/var/tmp/ext-updater";
    std::string action_script = "/var/lib/ext-updater/action_script.jsonl";
    std::string installation_id_file = "/var/lib/ext-updater/installation.id";
    std::string broken_list;
    std::string repository_url;
    std::string progress_file;
    std::string log_level;
    std::string log_file;

    std::optional<bool> force_https;
    std::optional<bool> first_launch;
    std::optional<bool> progress;
    std::optional<std::uint64_t> connect_timeout_sec;

    // Errors are written to err; the object is left reset on failure.
    bool LoadFile(const std::string &path, std::string &err);

    void Reset();
};

} // namespace extupd::config
