#pragma once

#include "update/progress.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace extupd {

// Rewrites a small JSON status file (atomically, via rename) on every event.
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string path_;
    int last_percent_ = -1;
};

class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    std::mutex mu_;
    int last_percent_ = -1;
    std::uint64_t last_kib_ = 0;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace extupd
