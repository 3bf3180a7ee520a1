#include "update/action_script.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <optional>

namespace fs = std::filesystem;

namespace extupd {

namespace {

using json = nlohmann::json;

std::optional<ActionCommand::Kind> KindFromName(const std::string& name) {
    if (name == "delete") return ActionCommand::Kind::Delete;
    if (name == "copy") return ActionCommand::Kind::Copy;
    if (name == "unzip") return ActionCommand::Kind::Unzip;
    return std::nullopt;
}

std::string ToLine(const ActionCommand& command) {
    json j = {{"op", ActionKindName(command.kind)}};
    if (command.kind == ActionCommand::Kind::Delete) {
        j["path"] = command.source;
    } else {
        j["source"] = command.source;
        j["destination"] = command.destination;
    }
    return j.dump() + "\n";
}

std::expected<ActionCommand, std::string> FromLine(const std::string& line) {
    try {
        const auto j = json::parse(line);
        if (!j.is_object()) return std::unexpected("command must be a JSON object");

        auto kind = KindFromName(j.value("op", ""));
        if (!kind) return std::unexpected("unknown op '" + j.value("op", "") + "'");

        ActionCommand command;
        command.kind = *kind;
        if (command.kind == ActionCommand::Kind::Delete) {
            command.source = j.value("path", "");
        } else {
            command.source = j.value("source", "");
            command.destination = j.value("destination", "");
            if (command.destination.empty()) return std::unexpected("missing destination");
        }
        if (command.source.empty()) return std::unexpected("missing path");
        return command;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    }
}

Result Execute(const ActionCommand& command, const IArchiveExtractor& extractor) {
    std::error_code ec;
    switch (command.kind) {
        case ActionCommand::Kind::Delete:
            fs::remove_all(command.source, ec);
            break;

        case ActionCommand::Kind::Copy: {
            const fs::path dst(command.destination);
            if (dst.has_parent_path()) fs::create_directories(dst.parent_path(), ec);
            if (ec) break;
            if (fs::is_directory(command.source, ec)) {
                fs::copy(command.source, dst,
                         fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
            } else {
                fs::copy_file(command.source, dst, fs::copy_options::overwrite_existing, ec);
            }
            break;
        }

        case ActionCommand::Kind::Unzip:
            fs::create_directories(command.destination, ec);
            if (ec) break;
            return extractor.ExtractAll(command.source, command.destination);
    }

    if (ec) {
        return Result::Fail(ErrorKind::IOFailure,
                            std::string(ActionKindName(command.kind)) + " " + command.source + ": " +
                                ec.message(),
                            ec.value());
    }
    return Result::Ok();
}

} // namespace

const char* ActionKindName(ActionCommand::Kind kind) {
    switch (kind) {
        case ActionCommand::Kind::Delete: return "delete";
        case ActionCommand::Kind::Copy:   return "copy";
        case ActionCommand::Kind::Unzip:  return "unzip";
    }
    return "unknown";
}

ActionScript::ActionScript(std::string path) : path_(std::move(path)) {}

Result ActionScript::AppendAll(const std::vector<ActionCommand>& commands) {
    if (commands.empty()) return Result::Ok();

    std::string lines;
    for (const auto& command : commands) lines += ToLine(command);

    std::lock_guard<std::mutex> lk(mu_);

    const fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return Result::Fail(ErrorKind::IOFailure,
                                "cannot create " + parent.string() + ": " + ec.message(), ec.value());
        }
    }

    Fd fd;
    auto open_res = Fd::Open(path_, O_WRONLY | O_CREAT | O_APPEND, 0644, fd);
    if (!open_res.is_ok()) return open_res;

    // One write per batch: O_APPEND keeps concurrent writers from interleaving.
    auto write_res = fd.WriteAll(lines);
    if (!write_res.is_ok()) {
        write_res.msg = "cannot append to action script " + path_ + ": " + write_res.msg;
        return write_res;
    }

    auto sync_res = fd.Sync();
    if (!sync_res.is_ok()) return sync_res;

    for (const auto& command : commands) {
        LogInfo("Scheduled at next start: %s %s%s%s",
                ActionKindName(command.kind),
                command.source.c_str(),
                command.destination.empty() ? "" : " -> ",
                command.destination.c_str());
    }
    return Result::Ok();
}

Result ActionScript::Load(std::vector<ActionCommand>& out) const {
    out.clear();

    std::lock_guard<std::mutex> lk(mu_);

    std::error_code ec;
    if (!fs::exists(path_, ec)) return Result::Ok();

    std::ifstream is(path_);
    if (!is.good()) {
        return Result::Fail(ErrorKind::IOFailure, "cannot open action script " + path_);
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(is, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        auto parsed = FromLine(line);
        if (!parsed) {
            // A torn last line after a crash must not block the others.
            LogWarn("%s:%zu: skipping command: %s", path_.c_str(), line_no, parsed.error().c_str());
            continue;
        }
        out.push_back(std::move(*parsed));
    }
    return Result::Ok();
}

Result ActionScript::Replay(const IArchiveExtractor& extractor) {
    std::vector<ActionCommand> commands;
    auto load_res = Load(commands);
    if (!load_res.is_ok()) return load_res;
    if (commands.empty()) {
        LogDebug("No pending actions in %s", path_.c_str());
        return Result::Ok();
    }

    LogInfo("Running %zu pending actions from %s", commands.size(), path_.c_str());

    size_t failed = 0;
    std::string first_error;
    for (const auto& command : commands) {
        LogInfo("action: %s %s", ActionKindName(command.kind), command.source.c_str());
        auto res = Execute(command, extractor);
        if (!res.is_ok()) {
            LogError("action failed: %s", res.msg.c_str());
            if (failed == 0) first_error = res.msg;
            ++failed;
        }
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            return Result::Fail(ErrorKind::IOFailure,
                                "cannot remove action script " + path_ + ": " + ec.message(), ec.value());
        }
    }

    if (failed > 0) {
        return Result::Fail(ErrorKind::IOFailure,
                            std::to_string(failed) + " of " + std::to_string(commands.size()) +
                                " pending actions failed; first: " + first_error);
    }
    return Result::Ok();
}

} // namespace extupd
