#pragma once

#include "update/archive_extractor.hpp"
#include "util/result.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace extupd {

// One deferred filesystem operation, executed at the next controlled start.
struct ActionCommand {
    enum class Kind { Delete, Copy, Unzip };

    Kind kind = Kind::Delete;
    // Delete: the path to remove. Copy / Unzip: the file to read.
    std::string source;
    // Copy: target file. Unzip: target directory.
    std::string destination;

    static ActionCommand Delete(std::string path) { return {Kind::Delete, std::move(path), {}}; }
    static ActionCommand Copy(std::string from, std::string to) {
        return {Kind::Copy, std::move(from), std::move(to)};
    }
    static ActionCommand Unzip(std::string archive, std::string dir) {
        return {Kind::Unzip, std::move(archive), std::move(dir)};
    }

    bool operator==(const ActionCommand&) const = default;
};

const char* ActionKindName(ActionCommand::Kind kind);

// Append-only, ordered log of deferred commands.
class IActionLog {
  public:
    virtual ~IActionLog() = default;

    // Records all of commands, in order, or none of them.
    virtual Result AppendAll(const std::vector<ActionCommand>& commands) = 0;

    Result Append(const ActionCommand& command) { return AppendAll({command}); }
    Result AppendDeleteCommand(const std::string& path) { return Append(ActionCommand::Delete(path)); }
};

// Commands gathered in memory, handed to a real log with one AppendAll.
class ActionBatch final : public IActionLog {
  public:
    Result AppendAll(const std::vector<ActionCommand>& commands) override {
        commands_.insert(commands_.end(), commands.begin(), commands.end());
        return Result::Ok();
    }

    const std::vector<ActionCommand>& Commands() const { return commands_; }

  private:
    std::vector<ActionCommand> commands_;
};

// JSON-lines file, one command per line. Appends from concurrent plans are
// serialised; each batch is written with a single O_APPEND write and synced.
class ActionScript final : public IActionLog {
  public:
    explicit ActionScript(std::string path);

    Result AppendAll(const std::vector<ActionCommand>& commands) override;

    // Commands currently recorded, in append order. A missing script is empty.
    Result Load(std::vector<ActionCommand>& out) const;

    // Runs every recorded command in order, then removes the script. A failing
    // command is logged and the rest still run; the result reports failures.
    Result Replay(const IArchiveExtractor& extractor);

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    mutable std::mutex mu_;
};

} // namespace extupd
