#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace extupd::config {

void UpdaterConfigFromFile::Reset() {
    *this = UpdaterConfigFromFile{};
}

bool UpdaterConfigFromFile::LoadFile(const std::string& path, std::string& err) {
    Reset();

    nlohmann::json json;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        err += " in " + path;
        Reset();
        return false;
    }

    return true;
}

} // namespace extupd::config
