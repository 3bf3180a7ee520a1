#include "update/manifest_parser.hpp"

#include <nlohmann/json.hpp>

namespace extupd {

using json = nlohmann::json;

namespace {

std::expected<std::vector<std::string>, std::string> ParseDependsArray(const json& arr) {
    if (!arr.is_array()) {
        return std::unexpected("'depends' must be an array");
    }

    std::vector<std::string> out;
    out.reserve(arr.size());

    for (const auto& item : arr) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else if (item.is_object() && item.contains("id") && item["id"].is_string()) {
            out.push_back(item["id"].get<std::string>());
        } else {
            return std::unexpected("'depends' entries must be ids or {\"id\": ...} objects");
        }
    }

    return out;
}

} // namespace

std::expected<ExtensionDescriptor, std::string> ManifestParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        ExtensionDescriptor d;
        d.id = j.value("id", "");
        d.name = j.value("name", "");
        d.version = j.value("version", "");
        d.description = j.value("description", "");
        d.url = j.value("url", "");

        if (d.id.empty()) {
            // Older manifests only carry a name; the name doubles as the id there.
            d.id = d.name;
        }
        if (d.id.empty()) {
            return std::unexpected("manifest has neither 'id' nor 'name'");
        }
        if (d.name.empty()) {
            d.name = d.id;
        }

        if (j.contains("compatibility")) {
            const auto& c = j["compatibility"];
            if (!c.is_object()) {
                return std::unexpected("'compatibility' must be an object");
            }
            d.since_build = c.value("since_build", "");
            d.until_build = c.value("until_build", "");
        }

        if (j.contains("depends")) {
            auto parsed = ParseDependsArray(j["depends"]);
            if (!parsed)
                return std::unexpected(parsed.error());
            d.depends = std::move(*parsed);
        }

        return d;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

} // namespace extupd
